#include "TimeUtils.hpp"

namespace tether {
namespace {
bool readDigits(const string& text, size_t* pos, int count, int* value) {
  if (*pos + count > text.size()) {
    return false;
  }
  int result = 0;
  for (int i = 0; i < count; i++) {
    char c = text[*pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    result = result * 10 + (c - '0');
  }
  *pos += count;
  *value = result;
  return true;
}

bool expect(const string& text, size_t* pos, char c) {
  if (*pos >= text.size() || toupper(text[*pos]) != c) {
    return false;
  }
  (*pos)++;
  return true;
}
}  // namespace

string formatTimestamp(int64_t epochMillis) {
  time_t seconds = (time_t)(epochMillis / 1000);
  int millis = (int)(epochMillis % 1000);
  if (millis < 0) {
    millis += 1000;
    seconds--;
  }
  struct tm utc;
  gmtime_r(&seconds, &utc);
  char buffer[64];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  char result[80];
  snprintf(result, sizeof(result), "%s.%03dZ", buffer, millis);
  return string(result);
}

optional<int64_t> parseTimestamp(const string& text) {
  size_t pos = 0;
  int year, month, day, hour, minute, second;
  if (!readDigits(text, &pos, 4, &year) || !expect(text, &pos, '-') ||
      !readDigits(text, &pos, 2, &month) || !expect(text, &pos, '-') ||
      !readDigits(text, &pos, 2, &day) || !expect(text, &pos, 'T') ||
      !readDigits(text, &pos, 2, &hour) || !expect(text, &pos, ':') ||
      !readDigits(text, &pos, 2, &minute) || !expect(text, &pos, ':') ||
      !readDigits(text, &pos, 2, &second)) {
    return nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return nullopt;
  }

  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    pos++;
    int digits = 0;
    while (pos < text.size() && isdigit((unsigned char)text[pos])) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      digits++;
      pos++;
    }
    if (digits == 0) {
      return nullopt;
    }
    for (; digits < 3; digits++) {
      millis *= 10;
    }
  }

  int offsetSeconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    pos++;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '-' ? -1 : 1;
    pos++;
    int offsetHours, offsetMinutes;
    if (!readDigits(text, &pos, 2, &offsetHours) || !expect(text, &pos, ':') ||
        !readDigits(text, &pos, 2, &offsetMinutes)) {
      return nullopt;
    }
    offsetSeconds = sign * (offsetHours * 3600 + offsetMinutes * 60);
  } else {
    return nullopt;
  }
  if (pos != text.size()) {
    return nullopt;
  }

  struct tm utc;
  memset(&utc, 0, sizeof(utc));
  utc.tm_year = year - 1900;
  utc.tm_mon = month - 1;
  utc.tm_mday = day;
  utc.tm_hour = hour;
  utc.tm_min = minute;
  utc.tm_sec = second;
  time_t seconds = timegm(&utc);
  return (int64_t(seconds) - offsetSeconds) * 1000 + millis;
}
}  // namespace tether
