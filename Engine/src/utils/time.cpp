#include <utils/time.hpp>
#include <cctype>
#include <cstdio>

namespace Rosetta {

namespace {

bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return days[month - 1];
}

} // namespace

std::optional<DateTime> DateTime::parse(const std::string& text) {
    // 0123456789012345678
    // YYYY-MM-DD HH:MM:SS
    if (text.size() != 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    DateTime dt;
    if (!read_digits(text, 0, 4, dt.year) ||
        !read_digits(text, 5, 2, dt.month) ||
        !read_digits(text, 8, 2, dt.day) ||
        !read_digits(text, 11, 2, dt.hour) ||
        !read_digits(text, 14, 2, dt.minute) ||
        !read_digits(text, 17, 2, dt.second)) {
        return std::nullopt;
    }

    if (dt.month < 1 || dt.month > 12) return std::nullopt;
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) return std::nullopt;
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) return std::nullopt;

    return dt;
}

std::string DateTime::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, month, day, hour, minute, second);
    return buf;
}

} // namespace Rosetta
