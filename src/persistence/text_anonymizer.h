/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: text_anonymizer.h

    Description:
        Opaque text transform applied to free-text answers right before they
        are persisted. A failure is never fatal to a flush: the caller keeps
        the original text and logs a content-free warning.

        Implementations:
        - PassthroughAnonymizer: returns the text unchanged (no service
          configured)
        - HttpTextAnonymizer:    POST {"text": ...} to a URL, expects
                                 {"text": ...} back

*******************************************************************************/

#ifndef TEXT_ANONYMIZER_H
#define TEXT_ANONYMIZER_H

#include <stdexcept>
#include <string>

namespace dss {

class AnonymizationError : public std::runtime_error {
public:
    explicit AnonymizationError(const std::string& what) : std::runtime_error(what) {}
};

class TextAnonymizer {
public:
    virtual ~TextAnonymizer() = default;

    // Throws AnonymizationError. Messages never contain the input text.
    virtual std::string anonymize(const std::string& text) = 0;
};

class PassthroughAnonymizer : public TextAnonymizer {
public:
    std::string anonymize(const std::string& text) override { return text; }
};

class HttpTextAnonymizer : public TextAnonymizer {
private:
    std::string url_;
    int timeout_ms_;

public:
    HttpTextAnonymizer(const std::string& url, int timeout_ms)
        : url_(url), timeout_ms_(timeout_ms) {}

    std::string anonymize(const std::string& text) override;
};

} // namespace dss

#endif // TEXT_ANONYMIZER_H
