#pragma once

#include <corral/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace corral {

class Config;

struct UrlPolicy {
    std::vector<std::string> allowedSchemes{"http", "https"};
    // Empty means any domain
    std::vector<std::string> allowedDomains;
    std::vector<std::string> blockedDomains;
    size_t maxUrlLength = 2048;

    static UrlPolicy fromConfig(const Config& config);
};

struct UrlParts {
    std::string scheme;  // lower-case
    std::string host;    // lower-case, without port or brackets
};

std::optional<UrlParts> parseUrl(const std::string& url);

// True when host equals domain or is a subdomain of it
bool domainMatches(const std::string& host, const std::string& domain);

// SecurityError when the URL may not be opened under policy
Result<void> validateUrl(const std::string& url, const UrlPolicy& policy);

// Pull a navigation target out of free text:
//   a quoted token that starts with "http" or contains a dot,
//   else the first http(s):// token,
//   else "go to|navigate to|open|visit <domain.tld>" as https://<domain>
std::optional<std::string> extractUrl(const std::string& text);

} // namespace corral
