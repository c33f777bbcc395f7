#pragma once
#include <string>

class SpfServer;
class SpfRequest;

/**
 * RFC 7208 section 7 macro-string. Explanation strings may also use the
 * c, r and t macros. Besides the RFC letters, "%{_scope}" expands to the
 * request scope name.
 */
class SpfMacroString {
public:
    explicit SpfMacroString(std::string text, bool isExplanation = false);

    const std::string& text() const { return text_; }
    bool isExplanation() const { return isExplanation_; }
    bool hasMacros() const;

    // Throws SpfSyntaxError.
    void validate() const;

    // Throws SpfSyntaxError for a malformed string.
    std::string expand(const SpfServer& server, const SpfRequest& request) const;

private:
    std::string text_;
    bool isExplanation_;
};
