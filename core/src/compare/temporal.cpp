#include <cstdint>
#include <cstdio>
#include <string>

#include "sqljudge/normalizer.h"

namespace sqljudge {

namespace {

// Civil calendar <-> day count, proleptic Gregorian, day 0 = 1970-01-01.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

bool is_leap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

class Cursor {
 public:
  explicit Cursor(const std::string& text) : text_(text) {}

  bool digits(size_t count, int& out) {
    if (pos_ + count > text_.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
      const char c = text_[pos_ + i];
      if (c < '0' || c > '9') return false;
      value = value * 10 + (c - '0');
    }
    pos_ += count;
    out = value;
    return true;
  }

  bool accept(char c) {
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool peek_digit() const {
    return pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9';
  }

  bool done() const { return pos_ == text_.size(); }

 private:
  const std::string& text_;
  size_t pos_ = 0;
};

}  // namespace

bool canonicalize_temporal(const std::string& text, std::string& out, bool allow_date_only) {
  Cursor cur(text);
  int year = 0;
  int month = 0;
  int day = 0;
  if (!cur.digits(4, year) || !cur.accept('-') || !cur.digits(2, month) || !cur.accept('-') ||
      !cur.digits(2, day)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
    return false;
  }
  if (cur.done()) {
    if (!allow_date_only) return false;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    out = buf;
    return true;
  }
  if (!cur.accept('T') && !cur.accept(' ')) return false;

  int hour = 0;
  int minute = 0;
  int second = 0;
  int micros = 0;
  if (!cur.digits(2, hour) || !cur.accept(':') || !cur.digits(2, minute)) return false;
  if (cur.accept(':')) {
    if (!cur.digits(2, second)) return false;
    if (cur.accept('.')) {
      if (!cur.peek_digit()) return false;
      int place = 100000;
      while (cur.peek_digit()) {
        int digit = 0;
        cur.digits(1, digit);
        // Digits past microseconds are truncated.
        if (place > 0) {
          micros += digit * place;
          place /= 10;
        }
      }
    }
  }
  if (hour > 23 || minute > 59 || second > 59) return false;

  int offset_minutes = 0;
  if (!cur.accept('Z')) {
    int sign = 0;
    if (cur.accept('+')) {
      sign = 1;
    } else if (cur.accept('-')) {
      sign = -1;
    }
    if (sign != 0) {
      int off_h = 0;
      int off_m = 0;
      if (!cur.digits(2, off_h)) return false;
      if (cur.accept(':')) {
        if (!cur.digits(2, off_m)) return false;
      } else if (cur.peek_digit() && !cur.digits(2, off_m)) {
        return false;
      }
      if (off_h > 23 || off_m > 59) return false;
      offset_minutes = sign * (off_h * 60 + off_m);
    }
  }
  if (!cur.done()) return false;

  int64_t seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400 +
                    hour * 3600 + minute * 60 + second - static_cast<int64_t>(offset_minutes) * 60;
  int64_t days = seconds >= 0 ? seconds / 86400 : -((-seconds + 86399) / 86400);
  int64_t rem = seconds - days * 86400;
  int64_t y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civil_from_days(days, y, m, d);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06dZ",
                static_cast<long long>(y), m, d, static_cast<long long>(rem / 3600),
                static_cast<long long>((rem % 3600) / 60), static_cast<long long>(rem % 60), micros);
  out = buf;
  return true;
}

}  // namespace sqljudge
