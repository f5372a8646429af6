#ifndef PRIVACYGUARD_DETECT_NER_BACKEND_HPP
#define PRIVACYGUARD_DETECT_NER_BACKEND_HPP

#include <string>
#include <vector>

namespace privacyguard {
namespace detect {

enum class OffsetUnit {
    Byte,      // offsets into the UTF-8 bytes
    Codepoint  // offsets in Unicode scalar values
};

// One entity as the model reports it, offsets still in the backend's unit.
struct RawEntity
{
    size_t start = 0;
    size_t end = 0;
    std::string label;
    double score = 1.0;
};

/*
  NerBackend
  --------------------------------
  A named-entity model for one language. Inference failures throw.
  Implementations must allow concurrent infer() calls.
*/
class NerBackend
{
public:
    virtual ~NerBackend() = default;

    virtual std::vector<RawEntity> infer(const std::string &text) const = 0;

    virtual OffsetUnit offsetUnit() const = 0;

    virtual std::string describe() const = 0;
};

} // namespace detect
} // namespace privacyguard

#endif // PRIVACYGUARD_DETECT_NER_BACKEND_HPP
