#ifndef ENCGEN_ERRORS_H
#define ENCGEN_ERRORS_H

#include <stdexcept>
#include <string>

namespace encgen {

// A parameter combination for which no physical model is defined
class UnsupportedConfiguration : public std::logic_error {
public:
    explicit UnsupportedConfiguration(const std::string& what)
        : std::logic_error(what) {}
};

// Statistical inputs outside the domain the helpers are defined on
class NumericDomainError : public std::domain_error {
public:
    explicit NumericDomainError(const std::string& what)
        : std::domain_error(what) {}
};

} // namespace encgen

#endif // ENCGEN_ERRORS_H
