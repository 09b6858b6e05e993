#include <relcheck/tools/command.h>

#include <relcheck/run/run_orchestrator.h>

#include <fmt/format.h>

namespace relcheck::tools {

class CheckCommand : public Command {
public:
    CheckCommand()
        : Command("check", "Check backend health, collection and embedding dimensions") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("check", getDescription());
        cmd->add_option("--probe", probeText_, "Text embedded to verify the embedding service")
            ->default_val("health check");
        cmd->add_flag("--no-embed", skipEmbed_, "Do not call the embedding service");
        addCommonOptions(*cmd);
        cmd->callback([this]() { shouldExecute_ = true; });
    }

    int execute() override {
        if (!shouldExecute_)
            return kExitOk;

        auto cfgResult = loadConfig();
        if (!cfgResult)
            return fail("Configuration error", cfgResult.error());
        const config::AppConfig cfg = std::move(cfgResult).value();

        auto ctx = run::buildRunContext(cfg);
        if (!ctx)
            return fail("Cannot set up the check", ctx.error());
        auto& context = ctx.value();

        log(fmt::format("Backend:   {}", context.backend->name()));
        log(fmt::format("Embedding: {} ({} dims)", context.embedder->modelName(),
                        context.embedder->dimension()));

        run::RunOrchestrator orchestrator(cfg, *context.embedder, *context.backend);
        auto pre = orchestrator.preflight();
        if (!pre)
            return fail("Preflight failed", pre.error());

        const auto& info = pre.value().collection;
        log(fmt::format("Collection '{}': {} points, {}-d vectors, {} distance, status {}",
                        cfg.backend.collection, info.pointCount, info.vectorSize, info.distance,
                        info.status));

        if (!skipEmbed_) {
            const auto token = CancellationToken().withTimeout(cfg.run.testTimeout);
            auto vec = context.embedder->embed(probeText_, token);
            if (!vec)
                return fail("Embedding probe failed", vec.error());
            log(fmt::format("Embedding probe: {} floats", vec.value().size()));
        }

        log("OK");
        return kExitOk;
    }

private:
    bool shouldExecute_ = false;
    bool skipEmbed_ = false;
    std::string probeText_;
};

std::unique_ptr<Command> createCheckCommand() {
    return std::make_unique<CheckCommand>();
}

} // namespace relcheck::tools
