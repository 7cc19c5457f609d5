#include "PairingUri.hpp"

namespace tether {
namespace {
PairingResult failure(PairingError error, const string& detail) {
  PairingResult result;
  result.error = error;
  result.detail = detail;
  return result;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isUnreserved(unsigned char c) {
  return isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}
}  // namespace

string pairingErrorName(PairingError error) {
  switch (error) {
    case PairingError::NONE:
      return "None";
    case PairingError::MALFORMED_URI:
      return "MalformedURI";
    case PairingError::UNSUPPORTED_SCHEME:
      return "UnsupportedScheme";
    case PairingError::MISSING_TOKEN:
      return "MissingToken";
  }
  return "Unknown";
}

string PairingUri::percentEncode(const string& s) {
  static const char hex[] = "0123456789ABCDEF";
  string out;
  for (unsigned char c : s) {
    if (isUnreserved(c)) {
      out.push_back((char)c);
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

optional<string> PairingUri::percentDecode(const string& s) {
  string out;
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '%') {
      if (i + 2 >= s.size()) {
        return nullopt;
      }
      int high = hexValue(s[i + 1]);
      int low = hexValue(s[i + 2]);
      if (high < 0 || low < 0) {
        return nullopt;
      }
      out.push_back((char)((high << 4) | low));
      i += 2;
    } else if (s[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

string PairingUri::encode(const ConnectionDescriptor& descriptor) {
  string host = descriptor.getHost();
  if (host.find(':') != string::npos) {
    host = "[" + host + "]";
  }
  return schemeName(descriptor.getScheme()) + "://" + host + ":" +
         to_string(descriptor.getPort()) + RELAY_WS_PATH +
         "?key=" + percentEncode(descriptor.getSessionToken());
}

PairingResult PairingUri::decode(const string& rawUri) {
  string uri = trim(rawUri);
  if (uri.empty()) {
    return failure(PairingError::MALFORMED_URI, "empty uri");
  }
  for (unsigned char c : uri) {
    if (isspace(c) || iscntrl(c)) {
      return failure(PairingError::MALFORMED_URI, "uri contains whitespace");
    }
  }

  auto schemeEnd = uri.find("://");
  if (schemeEnd == string::npos || schemeEnd == 0) {
    return failure(PairingError::MALFORMED_URI, "missing scheme");
  }
  string scheme = toLower(uri.substr(0, schemeEnd));
  for (size_t i = 0; i < scheme.size(); i++) {
    char c = scheme[i];
    bool valid = isalpha((unsigned char)c) ||
                 (i > 0 && (isdigit((unsigned char)c) || c == '+' ||
                            c == '-' || c == '.'));
    if (!valid) {
      return failure(PairingError::MALFORMED_URI, "invalid scheme");
    }
  }

  string rest = uri.substr(schemeEnd + 3);
  auto authorityEnd = rest.find_first_of("/?#");
  string authority = rest.substr(0, authorityEnd);
  string remainder =
      authorityEnd == string::npos ? string() : rest.substr(authorityEnd);

  if (authority.find('@') != string::npos) {
    return failure(PairingError::MALFORMED_URI, "user info is not allowed");
  }

  string host;
  string portString;
  bool hasPort = false;
  if (!authority.empty() && authority[0] == '[') {
    auto closeBracket = authority.find(']');
    if (closeBracket == string::npos) {
      return failure(PairingError::MALFORMED_URI, "unterminated ipv6 host");
    }
    host = authority.substr(1, closeBracket - 1);
    string afterBracket = authority.substr(closeBracket + 1);
    if (!afterBracket.empty()) {
      if (afterBracket[0] != ':') {
        return failure(PairingError::MALFORMED_URI, "garbage after ipv6 host");
      }
      hasPort = true;
      portString = afterBracket.substr(1);
    }
  } else {
    auto colon = authority.find(':');
    host = authority.substr(0, colon);
    if (colon != string::npos) {
      hasPort = true;
      portString = authority.substr(colon + 1);
    }
  }
  if (host.empty()) {
    return failure(PairingError::MALFORMED_URI, "missing host");
  }

  int port = DEFAULT_RELAY_PORT;
  if (hasPort) {
    if (portString.empty() || portString.size() > 5 ||
        !all_of(portString.begin(), portString.end(),
                [](unsigned char c) { return isdigit(c); })) {
      return failure(PairingError::MALFORMED_URI,
                     "invalid port '" + portString + "'");
    }
    port = stoi(portString);
    if (port < 1 || port > 65535) {
      return failure(PairingError::MALFORMED_URI,
                     "port out of range: " + portString);
    }
  }

  string query;
  auto queryStart = remainder.find('?');
  if (queryStart != string::npos) {
    query = remainder.substr(queryStart + 1);
    auto fragment = query.find('#');
    if (fragment != string::npos) {
      query = query.substr(0, fragment);
    }
  }

  Scheme parsedScheme;
  if (scheme == "ws") {
    parsedScheme = Scheme::WS;
  } else if (scheme == "wss") {
    parsedScheme = Scheme::WSS;
  } else {
    return failure(PairingError::UNSUPPORTED_SCHEME,
                   "unsupported scheme '" + scheme + "'");
  }

  string token;
  for (const auto& pair : split(query, '&')) {
    auto equals = pair.find('=');
    string name = pair.substr(0, equals);
    if (name != "key") {
      continue;
    }
    string value = equals == string::npos ? string() : pair.substr(equals + 1);
    auto decoded = percentDecode(value);
    if (!decoded) {
      return failure(PairingError::MALFORMED_URI, "bad escape in key");
    }
    token = *decoded;
    break;
  }
  if (token.empty()) {
    return failure(PairingError::MISSING_TOKEN, "no key parameter in uri");
  }

  PairingResult result;
  result.descriptor = ConnectionDescriptor(host, port, token, parsedScheme);
  return result;
}
}  // namespace tether
