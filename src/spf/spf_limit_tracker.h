#pragma once

// Counters shared by a root request and every sub-request spawned from it
// (include, redirect). Created once per top-level evaluation.
class SpfLimitTracker {
public:
    void reset();

    // Both count first, then throw SpfProcessingLimitExceededError once the
    // count is above max. Call before the DNS work they guard.
    void countDnsInteractiveTerm(int max);
    void countVoidDnsLookup(int max);

    int dnsInteractiveTerms() const { return dnsInteractiveTerms_; }
    int voidDnsLookups() const { return voidDnsLookups_; }

private:
    int dnsInteractiveTerms_ = 0;
    int voidDnsLookups_ = 0;
};
