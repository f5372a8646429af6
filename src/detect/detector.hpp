#ifndef PRIVACYGUARD_DETECT_DETECTOR_HPP
#define PRIVACYGUARD_DETECT_DETECTOR_HPP

#include <string>
#include "core/span.hpp"

namespace privacyguard {
namespace detect {

/*
  Detector
  --------------------------------
  Adapter between one detection source and the reconciler.

  Contract:
    - Offsets are codepoint indices into the text that was passed in.
    - Span::content is sliced from that same text.
    - No ordering is promised.
    - An unsupported language falls back to a default and logs a warning.
    - A failing source throws; PrivacyGuard turns that into DetectorFailure.

  detect() may be called concurrently for different texts.
*/

class Detector
{
public:
    virtual ~Detector() = default;

    virtual std::string name() const = 0;

    virtual core::SpanList detect(const std::string &text, const std::string &language) const = 0;
};

} // namespace detect
} // namespace privacyguard

#endif // PRIVACYGUARD_DETECT_DETECTOR_HPP
