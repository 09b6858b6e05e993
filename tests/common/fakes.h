// In-process stand-ins for the embedding service, the search backend and the HTTP transport

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <relcheck/ml/provider.h>
#include <relcheck/net/http_client.h>
#include <relcheck/search/search_backend.h>

namespace relcheck::test {

/**
 * Assigns each query text a slot number. The fake embedder writes the slot into
 * the first vector component so the fake backend can tell which query it serves.
 */
class QueryBook {
public:
    float intern(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::size_t i = 0; i < texts_.size(); ++i) {
            if (texts_[i] == text)
                return static_cast<float>(i);
        }
        texts_.push_back(text);
        return static_cast<float>(texts_.size() - 1);
    }

    std::string lookup(float slot) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto i = static_cast<std::size_t>(slot);
        return i < texts_.size() ? texts_[i] : std::string{};
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
};

class FakeEmbedder : public ml::IEmbeddingProvider {
public:
    FakeEmbedder(std::shared_ptr<QueryBook> book, std::size_t dim = 8)
        : book_(std::move(book)), dim_(dim) {}

    Result<Embedding> embed(const std::string& text, const CancellationToken& cancel) override {
        calls_.fetch_add(1);
        if (text.empty())
            return Error{ErrorCode::InvalidArgument, "empty query text"};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = failures_.find(text); it != failures_.end())
                return it->second;
        }
        if (hang_) {
            cancel.sleepFor(std::chrono::hours(1));
            return net::cancellationError(cancel, "embedding");
        }
        Embedding v(dim_, 0.0f);
        v[0] = book_->intern(text);
        return v;
    }

    size_t dimension() const override { return dim_; }
    std::string providerName() const override { return "fake"; }
    std::string modelName() const override { return "fake-embedder"; }

    void failFor(const std::string& text, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[text] = std::move(error);
    }

    // Block every call until the token trips
    void hang() { hang_ = true; }

    std::size_t calls() const { return calls_.load(); }

private:
    std::shared_ptr<QueryBook> book_;
    std::size_t dim_;
    std::atomic<bool> hang_{false};
    std::atomic<std::size_t> calls_{0};
    std::mutex mutex_;
    std::map<std::string, Error> failures_;
};

/// Candidates listed in order; ranks and scores follow the given pairs.
inline std::vector<search::SearchCandidate>
ranked(const std::vector<std::pair<std::string, double>>& hits) {
    std::vector<search::SearchCandidate> out;
    int rank = 0;
    for (const auto& [id, score] : hits) {
        search::SearchCandidate c;
        c.documentId = id;
        c.score = score;
        c.rank = ++rank;
        out.push_back(std::move(c));
    }
    return out;
}

class FakeBackend : public search::ISearchBackend {
public:
    explicit FakeBackend(std::shared_ptr<QueryBook> book) : book_(std::move(book)) {
        info_.vectorSize = 8;
        info_.distance = "Cosine";
        info_.pointCount = 100;
        info_.status = "green";
    }

    Result<std::vector<search::SearchCandidate>> search(const Embedding& vector, int topK,
                                                        const CancellationToken& cancel) override {
        searches_.fetch_add(1);
        lastTopK_.store(topK);
        const auto text = vector.empty() ? std::string{} : book_->lookup(vector[0]);
        if (hang_ || hangsFor(text)) {
            cancel.sleepFor(std::chrono::hours(1));
            return net::cancellationError(cancel, "search");
        }
        if (delay_.count() > 0 && !cancel.sleepFor(delay_))
            return net::cancellationError(cancel, "search");

        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = errors_.find(text); it != errors_.end())
            return it->second;
        if (defaultError_)
            return *defaultError_;
        if (auto it = scripts_.find(text); it != scripts_.end())
            return it->second;
        return std::vector<search::SearchCandidate>{};
    }

    Result<search::CollectionInfo> getCollectionInfo(const CancellationToken&) override {
        if (infoError_)
            return *infoError_;
        return info_;
    }

    Result<void> healthCheck(const CancellationToken&) override {
        if (healthError_)
            return *healthError_;
        return Result<void>();
    }

    std::string name() const override { return "fake-backend"; }

    void script(const std::string& query, std::vector<search::SearchCandidate> hits) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[query] = std::move(hits);
    }

    void failFor(const std::string& query, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[query] = std::move(error);
    }

    void failAll(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultError_ = std::move(error);
    }

    void hang() { hang_ = true; }

    // Only searches for @p query block until cancelled.
    void hangFor(const std::string& query) {
        std::lock_guard<std::mutex> lock(mutex_);
        hanging_.insert(query);
    }
    void delay(std::chrono::milliseconds d) { delay_ = d; }

    search::CollectionInfo& info() { return info_; }
    void failInfo(Error error) { infoError_ = std::move(error); }
    void failHealth(Error error) { healthError_ = std::move(error); }

    std::size_t searches() const { return searches_.load(); }
    int lastTopK() const { return lastTopK_.load(); }

private:
    bool hangsFor(const std::string& query) {
        std::lock_guard<std::mutex> lock(mutex_);
        return hanging_.count(query) > 0;
    }

    std::shared_ptr<QueryBook> book_;
    std::atomic<bool> hang_{false};
    std::chrono::milliseconds delay_{0};
    std::atomic<std::size_t> searches_{0};
    std::atomic<int> lastTopK_{0};
    std::mutex mutex_;
    std::map<std::string, std::vector<search::SearchCandidate>> scripts_;
    std::map<std::string, Error> errors_;
    std::set<std::string> hanging_;
    std::optional<Error> defaultError_;
    search::CollectionInfo info_;
    std::optional<Error> infoError_;
    std::optional<Error> healthError_;
};

/**
 * Scripted transport: each request is answered by the handler, or by the queued
 * replies in order when no handler is set. Every request is recorded.
 */
class FakeHttpClient : public net::IHttpClient {
public:
    using Handler = std::function<Result<net::HttpResponse>(const net::HttpRequest&)>;

    Result<net::HttpResponse> send(const net::HttpRequest& request,
                                   const CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (handler_)
            return handler_(request);
        if (replies_.empty())
            return Error{ErrorCode::ConnectionFailed, "no scripted reply"};
        auto reply = replies_.front();
        replies_.erase(replies_.begin());
        return reply;
    }

    void onRequest(Handler handler) { handler_ = std::move(handler); }

    void reply(long status, std::string body) {
        net::HttpResponse r;
        r.status = status;
        r.body = std::move(body);
        replies_.emplace_back(std::move(r));
    }

    void replyError(Error error) { replies_.emplace_back(std::move(error)); }

    std::vector<net::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::vector<Result<net::HttpResponse>> replies_;
    std::vector<net::HttpRequest> requests_;
};

} // namespace relcheck::test
