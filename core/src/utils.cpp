#include "utils.hpp"
#include <iomanip>    // std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        [[noreturn]] void badTimestamp(const std::string& what, const std::string& text) {
            throw std::runtime_error("Invalid timestamp '" + text + "': " + what);
        }

        // Digits after the decimal point, truncated to nanoseconds
        std::chrono::nanoseconds readFraction(std::istream& in) {
            std::string digits;
            while (std::isdigit(in.peek())) {
                const char c = static_cast<char>(in.get());
                if (digits.size() < 9) digits += c;
            }
            if (digits.empty()) {
                return std::chrono::nanoseconds(0);
            }
            digits.append(9 - digits.size(), '0');
            return std::chrono::nanoseconds(std::stoll(digits));
        }

        // 'Z' or +HH:MM / -HH:MM, as the amount local time runs ahead of UTC
        std::chrono::minutes readUtcOffset(std::istream& in, const std::string& text) {
            char designator = 0;
            if (!(in >> designator)) {
                badTimestamp("missing 'Z' or UTC offset", text);
            }
            if (designator == 'Z') {
                return std::chrono::minutes(0);
            }
            if (designator != '+' && designator != '-') {
                badTimestamp(std::string("unexpected '") + designator + "' where the UTC offset should be", text);
            }
            int hours = 0;
            int minutes = 0;
            char colon = 0;
            if (!(in >> hours >> colon >> minutes) || colon != ':'
                || hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
                badTimestamp("UTC offset is not HH:MM", text);
            }
            const std::chrono::minutes offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
            return designator == '-' ? -offset : offset;
        }

        Timestamp fromUtcFields(std::tm& fields, const std::string& text) {
            #ifdef _WIN32
                const time_t seconds = _mkgmtime(&fields);
            #else
                const time_t seconds = timegm(&fields);
            #endif
            if (seconds == static_cast<time_t>(-1)) {
                badTimestamp("date is out of range", text);
            }
            return std::chrono::system_clock::from_time_t(seconds);
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::istringstream in(iso_string);
        std::tm fields = {};

        // Date-only: midnight UTC
        if (iso_string.size() == 10) {
            in >> std::get_time(&fields, "%Y-%m-%d");
            if (in.fail()) {
                badTimestamp("expected YYYY-MM-DD", iso_string);
            }
            return fromUtcFields(fields, iso_string);
        }

        in >> std::get_time(&fields, "%Y-%m-%dT%H:%M:%S");
        if (in.fail()) {
            badTimestamp("expected YYYY-MM-DDTHH:MM:SS", iso_string);
        }
        std::chrono::nanoseconds fraction(0);
        if (in.peek() == '.') {
            in.ignore();
            fraction = readFraction(in);
        }
        const auto offset = readUtcOffset(in, iso_string);
        if (in.peek() != std::char_traits<char>::eof()) {
            badTimestamp("trailing characters", iso_string);
        }

        // 2024-01-01T05:30:00+05:30 is 2024-01-01T00:00:00Z
        return fromUtcFields(fields, iso_string)
             + std::chrono::duration_cast<Timestamp::duration>(fraction)
             - offset;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    double secondsBetween(const Timestamp& from, const Timestamp& to) {
        return std::chrono::duration<double>(to - from).count();
    }

} // namespace utils
} // namespace core
