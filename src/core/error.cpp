/// @file error.cpp
/// @brief Error chain formatting and error statistics

#include <hoard/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>

namespace hoard_core {

namespace {

const char* kind_tag(const Error& error) {
    if (error.is<LoadError>()) return "load";
    if (error.is<HotReloadError>()) return "reload";
    if (error.is<HandleError>()) return "handle";
    return nullptr;
}

void format_one(std::ostringstream& out, const Error& error) {
    out << '[' << error_code_name(error.code());
    if (const char* tag = kind_tag(error)) {
        out << '/' << tag;
    }
    out << "] " << error.message();

    if (!error.context().empty()) {
        out << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            out << (first ? "" : ", ") << key << '=' << value;
            first = false;
        }
        out << '}';
    }
}

std::array<std::atomic<std::uint64_t>, k_error_code_count> s_counts{};

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream out;
    format_one(out, error);
    for (const Error* cause = error.cause(); cause != nullptr; cause = cause->cause()) {
        out << "\n  caused by: ";
        format_one(out, *cause);
    }
    return out.str();
}

Error error_from_exception(const std::exception& ex, ErrorCode code) {
    return Error(code, std::string(ex.what()));
}

// =============================================================================
// Statistics
// =============================================================================

namespace debug {

void record_error(const Error& error) {
    auto index = static_cast<std::size_t>(error.code());
    if (index < s_counts.size()) {
        s_counts[index].fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    std::uint64_t total = 0;
    for (const auto& count : s_counts) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

std::uint64_t error_count(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    return index < s_counts.size() ? s_counts[index].load(std::memory_order_relaxed) : 0;
}

void reset_error_stats() {
    for (auto& count : s_counts) {
        count.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream out;
    out << "Total: " << total_error_count() << '\n';
    for (std::size_t i = 0; i < s_counts.size(); ++i) {
        auto count = s_counts[i].load(std::memory_order_relaxed);
        if (count > 0) {
            out << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << count << '\n';
        }
    }
    return out.str();
}

} // namespace debug

} // namespace hoard_core
