#include <relcheck/core/time_utils.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace relcheck {

namespace {

std::tm toTm(TimePoint tp, bool utc) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (utc)
        ::gmtime_r(&t, &tm);
    else
        ::localtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string toIsoString(TimePoint tp) {
    auto tm = toTm(tp, true);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << 'Z';
    return oss.str();
}

Result<TimePoint> parseIsoString(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return Error{ErrorCode::InvalidData, "Not an ISO-8601 timestamp: '" + text + "'"};
    }
    auto tp = std::chrono::system_clock::from_time_t(::timegm(&tm));

    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()) && digits.size() < 9)
            digits.push_back(static_cast<char>(in.get()));
        if (!digits.empty()) {
            digits.resize(3, '0');
            tp += std::chrono::milliseconds(std::stoi(digits));
        }
    }
    return tp;
}

std::string toCompactStamp(TimePoint tp) {
    auto tm = toTm(tp, false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string toDisplayString(TimePoint tp) {
    auto tm = toTm(tp, false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace relcheck
