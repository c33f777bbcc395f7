#include "spf/spf_limit_tracker.h"
#include "spf/spf_errors.h"

#include <string>

void SpfLimitTracker::reset() {
    dnsInteractiveTerms_ = 0;
    voidDnsLookups_ = 0;
}

void SpfLimitTracker::countDnsInteractiveTerm(int max) {
    // RFC 4408 10.1/6
    if (++dnsInteractiveTerms_ > max)
        throw SpfProcessingLimitExceededError(
            "Maximum DNS-interactive terms limit (" + std::to_string(max) + ") exceeded");
}

void SpfLimitTracker::countVoidDnsLookup(int max) {
    // RFC 7208 4.6.4
    if (++voidDnsLookups_ > max)
        throw SpfProcessingLimitExceededError(
            "Maximum void DNS look-ups limit (" + std::to_string(max) + ") exceeded");
}
