#ifndef PRIVACYGUARD_CORE_ERRORS_HPP
#define PRIVACYGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace privacyguard {

/*
  Error taxonomy
  --------------------------------
  Fatal conditions are exceptions rooted at GuardError.
  Non-fatal conditions never throw:
    - unsupported language   -> WARN + default language
    - malformed span         -> WARN + span dropped by the reconciler
    - restoration mismatch   -> placeholder left literally in the text
*/

class GuardError : public std::runtime_error
{
public:
    explicit GuardError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

// A detector failed; the whole anonymize call is aborted.
class DetectorFailure : public GuardError
{
public:
    DetectorFailure(const std::string &detectorName, const std::string &reason)
        : GuardError("detector '" + detectorName + "' failed: " + reason),
          m_detectorName(detectorName)
    {
    }

    const std::string &detectorName() const { return m_detectorName; }

private:
    std::string m_detectorName;
};

class ConfigError : public GuardError
{
public:
    explicit ConfigError(const std::string &what) : GuardError(what) {}
};

class VaultError : public GuardError
{
public:
    explicit VaultError(const std::string &what) : GuardError(what) {}
};

class JsonError : public GuardError
{
public:
    explicit JsonError(const std::string &what) : GuardError(what) {}
};

} // namespace privacyguard

#endif // PRIVACYGUARD_CORE_ERRORS_HPP
