/**
 * @file email_validator.cpp
 * @brief Email address syntax validation
 */

#include "profile/validation/email_validator.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace profile::validation {

namespace {

const std::regex& localPartPattern() {
    static const std::regex pattern(
        R"(^[A-Za-z0-9!#$%&'*+/=?^_`{|}~-]+(\.[A-Za-z0-9!#$%&'*+/=?^_`{|}~-]+)*$)");
    return pattern;
}

const std::regex& domainLabelPattern() {
    static const std::regex pattern(R"(^[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?$)");
    return pattern;
}

std::vector<std::string> splitLabels(const std::string& domain) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t dot = domain.find('.', start);
        if (dot == std::string::npos) {
            labels.push_back(domain.substr(start));
            break;
        }
        labels.push_back(domain.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

} // namespace

bool isValidEmail(const std::string& email) {
    size_t at = email.find('@');
    if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) {
        return false;
    }

    std::string local = email.substr(0, at);
    std::string domain = email.substr(at + 1);

    if (local.empty() || local.length() > EMAIL_LOCAL_PART_MAX) {
        return false;
    }
    if (!std::regex_match(local, localPartPattern())) {
        return false;
    }

    if (domain.empty()) {
        return false;
    }
    auto labels = splitLabels(domain);
    if (labels.size() < 2) {
        return false;
    }
    for (const auto& label : labels) {
        if (label.empty() || label.length() > EMAIL_DOMAIN_LABEL_MAX) {
            return false;
        }
        if (!std::regex_match(label, domainLabelPattern())) {
            return false;
        }
    }

    // "user@10.0.0.1" is not a hostname
    const std::string& tld = labels.back();
    if (std::all_of(tld.begin(), tld.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }

    return true;
}

} // namespace profile::validation
