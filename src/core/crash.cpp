/// @file crash.cpp
/// @brief CrashChannel implementation

#include <media_engine/core/crash.hpp>
#include <media_engine/core/log.hpp>

#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace media_core {

// =============================================================================
// Exception Formatting
// =============================================================================

namespace {

void append_exception(std::ostringstream& oss, const std::exception& ex, int depth) {
    if (depth > 0) {
        oss << "\n" << std::string(static_cast<std::size_t>(depth) * 2, ' ') << "caused by: ";
    }
    oss << ex.what();

    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception& nested) {
        append_exception(oss, nested, depth + 1);
    } catch (...) {
        oss << "\n" << std::string(static_cast<std::size_t>(depth + 1) * 2, ' ')
            << "caused by: unknown exception";
    }
}

} // anonymous namespace

std::string describe_exception(std::exception_ptr ptr) {
    if (!ptr) {
        return "no exception";
    }

    std::ostringstream oss;
    try {
        std::rethrow_exception(ptr);
    } catch (const std::exception& ex) {
        append_exception(oss, ex, 0);
    } catch (...) {
        oss << "unknown exception";
    }
    return oss.str();
}

std::string describe_current_exception() {
    return describe_exception(std::current_exception());
}

std::string CrashReport::formatted() const {
    auto t = std::chrono::system_clock::to_time_t(time);

    std::ostringstream oss;
    oss << "Crash in thread '" << thread_name << "' at "
        << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S") << "\n"
        << message;
    return oss.str();
}

// =============================================================================
// CrashChannel
// =============================================================================

void CrashChannel::report(CrashReport report) {
    get_logger("crash")->critical("{}", report.formatted());

    std::lock_guard lock(m_mutex);
    m_reports.push_back(std::move(report));
}

void CrashChannel::report(const std::string& thread_name, const std::string& message) {
    CrashReport r;
    r.thread_name = thread_name;
    r.message = message;
    report(std::move(r));
}

bool CrashChannel::has_crashed() const {
    std::lock_guard lock(m_mutex);
    return !m_reports.empty();
}

std::size_t CrashChannel::count() const {
    std::lock_guard lock(m_mutex);
    return m_reports.size();
}

std::optional<CrashReport> CrashChannel::take() {
    std::lock_guard lock(m_mutex);
    if (m_reports.empty()) {
        return std::nullopt;
    }
    CrashReport r = std::move(m_reports.front());
    m_reports.pop_front();
    return r;
}

std::vector<CrashReport> CrashChannel::drain() {
    std::lock_guard lock(m_mutex);
    std::vector<CrashReport> reports(
        std::make_move_iterator(m_reports.begin()),
        std::make_move_iterator(m_reports.end()));
    m_reports.clear();
    return reports;
}

Result<void> CrashChannel::check() {
    auto r = take();
    if (!r) {
        return Ok();
    }
    Error err(ErrorCode::Unknown, r->formatted());
    err.with_context("thread", r->thread_name);
    return Err(std::move(err));
}

} // namespace media_core
