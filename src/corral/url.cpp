#include <corral/url.h>
#include <corral/config.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>
#include <regex>

namespace corral {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

UrlPolicy UrlPolicy::fromConfig(const Config& config) {
    UrlPolicy policy;
    auto schemes = config.getList(Config::KEY_SECURITY_ALLOWED_SCHEMES);
    if (!schemes.empty()) {
        policy.allowedSchemes = std::move(schemes);
    }
    policy.allowedDomains = config.getList(Config::KEY_SECURITY_ALLOWED_DOMAINS);
    policy.blockedDomains = config.getList(Config::KEY_SECURITY_BLOCKED_DOMAINS);
    policy.maxUrlLength = static_cast<size_t>(
        config.get<int>(Config::KEY_SECURITY_MAX_URL_LENGTH, static_cast<int>(policy.maxUrlLength)));
    return policy;
}

std::optional<UrlParts> parseUrl(const std::string& url) {
    static const std::regex pattern(R"(^([A-Za-z][A-Za-z0-9+.\-]*):(?://([^/?#]*))?)");
    std::smatch match;
    if (!std::regex_search(url, match, pattern)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = toLower(match[1].str());

    std::string authority = match[2].str();
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        parts.host = authority.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        parts.host = authority.substr(0, authority.find(':'));
    }
    while (!parts.host.empty() && parts.host.back() == '.') {
        parts.host.pop_back();
    }
    parts.host = toLower(parts.host);
    return parts;
}

bool domainMatches(const std::string& host, const std::string& domain) {
    const auto d = toLower(domain);
    if (d.empty()) return false;
    if (host == d) return true;
    return host.size() > d.size() &&
           host.compare(host.size() - d.size(), d.size(), d) == 0 &&
           host[host.size() - d.size() - 1] == '.';
}

Result<void> validateUrl(const std::string& url, const UrlPolicy& policy) {
    if (url.empty()) {
        return Err(Error::securityError("empty URL"));
    }
    if (url.size() > policy.maxUrlLength) {
        return Err(Error::securityError("URL longer than " + std::to_string(policy.maxUrlLength) + " characters"));
    }

    auto parts = parseUrl(url);
    if (!parts) {
        return Err(Error::securityError("malformed URL: " + url));
    }
    const bool schemeAllowed = std::any_of(policy.allowedSchemes.begin(), policy.allowedSchemes.end(),
        [&](const std::string& scheme) { return toLower(scheme) == parts->scheme; });
    if (!schemeAllowed) {
        return Err(Error::securityError("scheme '" + parts->scheme + "' is not allowed"));
    }
    if (parts->host.empty()) {
        return Err(Error::securityError("URL has no host: " + url));
    }

    for (const auto& blocked : policy.blockedDomains) {
        if (domainMatches(parts->host, blocked)) {
            return Err(Error::securityError("domain " + parts->host + " is blocked"));
        }
    }
    if (!policy.allowedDomains.empty()) {
        const bool allowed = std::any_of(policy.allowedDomains.begin(), policy.allowedDomains.end(),
            [&](const std::string& domain) { return domainMatches(parts->host, domain); });
        if (!allowed) {
            return Err(Error::securityError("domain " + parts->host + " is not in the allow list"));
        }
    }
    return Ok();
}

std::optional<std::string> extractUrl(const std::string& text) {
    static const std::regex quoted(R"(["']([^"']+)["'])");
    static const std::regex bare(R"((https?://[^\s]+))");
    static const std::regex domain(
        R"((?:go to|navigate to|open|visit)\s+([a-zA-Z0-9][a-zA-Z0-9-]{0,61}[a-zA-Z0-9]?\.[a-zA-Z]{2,}))",
        std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    if (std::regex_search(text, match, quoted)) {
        const auto candidate = match[1].str();
        if (candidate.rfind("http", 0) == 0 || candidate.find('.') != std::string::npos) {
            return candidate;
        }
    }
    if (std::regex_search(text, match, bare)) {
        return match[1].str();
    }
    if (std::regex_search(text, match, domain)) {
        return "https://" + match[1].str();
    }
    ytrace("extractUrl: no URL in '{}'", text);
    return std::nullopt;
}

} // namespace corral
