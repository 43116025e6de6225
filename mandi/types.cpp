#include <mandi/types.hpp>
#include <mandi/error.hpp>
#include <algorithm>
#include <cctype>

namespace mandi {

std::string to_string(QualityGrade grade) {
    switch (grade) {
        case QualityGrade::premium: return "premium";
        case QualityGrade::standard: return "standard";
        case QualityGrade::low: return "low";
    }
    return "";
}

std::string to_string(DataQuality quality) {
    switch (quality) {
        case DataQuality::high: return "high";
        case DataQuality::medium: return "medium";
        case DataQuality::low: return "low";
    }
    return "";
}

std::string to_string(Role role) {
    return role == Role::buyer ? "buyer" : "seller";
}

std::string to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::fair: return "fair";
        case Verdict::favorable: return "favorable";
        case Verdict::unfavorable: return "unfavorable";
        case Verdict::exploitative: return "exploitative";
    }
    return "";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::low: return "low";
        case Severity::medium: return "medium";
        case Severity::high: return "high";
        case Severity::critical: return "critical";
    }
    return "";
}

QualityGrade parse_grade(const std::string &text) {
    const std::string g = normalize(text);
    if (g == "premium") return QualityGrade::premium;
    if (g == "standard" or g == "good" or g == "average") return QualityGrade::standard;
    if (g == "low" or g == "below_average") return QualityGrade::low;
    throw InvalidInput("Unknown quality grade `" + text + "'");
}

DataQuality parse_data_quality(const std::string &text) {
    const std::string q = normalize(text);
    if (q == "high") return DataQuality::high;
    if (q == "medium") return DataQuality::medium;
    if (q == "low") return DataQuality::low;
    throw InvalidInput("Unknown data quality `" + text + "'");
}

Role parse_role(const std::string &text) {
    const std::string r = normalize(text);
    if (r == "buyer" or r == "buy") return Role::buyer;
    if (r == "seller" or r == "sell") return Role::seller;
    throw InvalidInput("Unknown role `" + text + "'");
}

DataQuality downgrade(DataQuality quality) {
    return quality == DataQuality::high ? DataQuality::medium : DataQuality::low;
}

Role counterpart(Role role) {
    return role == Role::buyer ? Role::seller : Role::buyer;
}

std::string normalize(const std::string &name) {
    auto first = std::find_if_not(name.begin(), name.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(name.rbegin(), name.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string result;
    if (first < last) result.assign(first, last);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

}
