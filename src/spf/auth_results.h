#pragma once
#include <string>

#include "spf/spf_result.h"

/* ===================== SPF ===================== */

struct SpfCheckResult {
    SpfResultCode result = SpfResultCode::None;
    std::string smtpMailFrom;
    std::string smtpHelo;
    std::string receivedSpf;    // full Received-SPF header line
    std::string explanation;    // authority explanation, fail only
    std::string problem;        // temperror/permerror/none text

    // RFC 8601 method result for the "spf" method
    std::string toHeaderValue(const std::string& authServId) const {
        std::string h = authServId + "; ";

        h += "spf=" + spfResultCodeName(result);
        if (!smtpMailFrom.empty())
            h += " smtp.mailfrom=" + smtpMailFrom;
        else if (!smtpHelo.empty())
            h += " smtp.helo=" + smtpHelo;

        return h;
    }
};
