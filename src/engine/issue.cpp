#include <muster/engine/issue.hpp>
#include <algorithm>

namespace muster {

Issue Issue::fatal(Kind k, std::string svc, std::string msg,
                   std::vector<std::string> rel) {
    Issue issue;
    issue.severity = Fatal;
    issue.kind = k;
    issue.service = std::move(svc);
    issue.related = std::move(rel);
    issue.message = std::move(msg);
    return issue;
}

Issue Issue::warning(Kind k, std::string svc, std::string msg,
                     std::vector<std::string> rel) {
    Issue issue = fatal(k, std::move(svc), std::move(msg), std::move(rel));
    issue.severity = Warning;
    return issue;
}

bool Issue::mentions(const std::string& name) const {
    return service == name ||
           std::find(related.begin(), related.end(), name) != related.end();
}

const char* Issue::kind_name(Kind k) {
    switch (k) {
        case UnknownService:            return "UnknownService";
        case DuplicateService:          return "DuplicateService";
        case MissingRequiredCapability: return "MissingRequiredCapability";
        case ConflictingServices:       return "ConflictingServices";
        case CyclicDependency:          return "CyclicDependency";
        case PortOutOfRange:            return "PortOutOfRange";
        case PortCollision:             return "PortCollision";
        case DataDirCollision:          return "DataDirCollision";
        case DataDirNotAbsolute:        return "DataDirNotAbsolute";
        case InvalidDomainFormat:       return "InvalidDomainFormat";
        case MissingDatabaseCredential: return "MissingDatabaseCredential";
        case InconsistentSslConfig:     return "InconsistentSslConfig";
        case MissingOptionalCapability: return "MissingOptionalCapability";
        case DevModeWithProdLikeDomain: return "DevModeWithProdLikeDomain";
        case DefaultDomainUnchanged:    return "DefaultDomainUnchanged";
        case UnencryptedDatabaseLink:   return "UnencryptedDatabaseLink";
        case SslDisabledInProd:         return "SslDisabledInProd";
    }
    return "Unknown";
}

const char* Issue::severity_name(Severity s) {
    return s == Fatal ? "error" : "warning";
}

std::string Issue::format() const {
    std::string result = severity_name(severity);
    result += "[";
    result += kind_name(kind);
    result += "]";
    if (!service.empty()) {
        result += " ";
        result += service;
    }
    result += ": ";
    result += message;
    return result;
}

} // namespace muster
