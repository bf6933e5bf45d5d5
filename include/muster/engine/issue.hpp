#pragma once

#include <string>
#include <vector>

namespace muster {

// One finding about the configuration. Fatal issues block activation;
// warnings are advisory.
struct Issue {
    enum Severity { Fatal, Warning };

    enum Kind {
        // resolution
        UnknownService,
        DuplicateService,
        MissingRequiredCapability,
        ConflictingServices,
        CyclicDependency,
        // validation
        PortOutOfRange,
        PortCollision,
        DataDirCollision,
        DataDirNotAbsolute,
        InvalidDomainFormat,
        MissingDatabaseCredential,
        InconsistentSslConfig,
        // advisory
        MissingOptionalCapability,
        DevModeWithProdLikeDomain,
        DefaultDomainUnchanged,
        UnencryptedDatabaseLink,
        SslDisabledInProd
    };

    Severity severity = Fatal;
    Kind kind = UnknownService;
    std::string service;
    std::vector<std::string> related;   // other party of a pair, rest of a cycle
    std::string message;

    static Issue fatal(Kind k, std::string svc, std::string msg,
                       std::vector<std::string> rel = {});
    static Issue warning(Kind k, std::string svc, std::string msg,
                         std::vector<std::string> rel = {});

    bool is_fatal() const { return severity == Fatal; }

    // True if the issue names the service, as subject or related party
    bool mentions(const std::string& name) const;

    // "error[PortCollision] gitea: message"
    std::string format() const;

    static const char* kind_name(Kind k);
    static const char* severity_name(Severity s);
};

} // namespace muster
