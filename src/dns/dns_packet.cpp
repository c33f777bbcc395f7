#include "dns_packet.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdio>
#include <stdexcept>

static void need(size_t off, size_t count, size_t len) {
    if (off + count > len)
        throw std::runtime_error("Truncated DNS message");
}

static uint16_t read16(const uint8_t* buf, size_t& off, size_t len) {
    need(off, 2, len);
    uint16_t v = static_cast<uint16_t>((buf[off] << 8) | buf[off + 1]);
    off += 2;
    return v;
}

static uint32_t read32(const uint8_t* buf, size_t& off, size_t len) {
    need(off, 4, len);
    uint32_t v = (static_cast<uint32_t>(buf[off]) << 24)
               | (static_cast<uint32_t>(buf[off + 1]) << 16)
               | (static_cast<uint32_t>(buf[off + 2]) << 8)
               | static_cast<uint32_t>(buf[off + 3]);
    off += 4;
    return v;
}

// Reads a possibly compressed name; off ends up behind the name as stored
// at the original position.
static std::string readName(const uint8_t* buf, size_t& off, size_t len) {
    std::string name;
    size_t pos = off;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        need(pos, 1, len);
        uint8_t l = buf[pos++];
        if (l == 0) break;

        if ((l & 0xC0) == 0xC0) {
            need(pos, 1, len);
            size_t ptr = (static_cast<size_t>(l & 0x3F) << 8) | buf[pos++];
            if (!jumped) off = pos;
            jumped = true;
            if (++jumps > 64 || ptr >= len)
                throw std::runtime_error("Bad DNS name compression pointer");
            pos = ptr;
            continue;
        }
        if ((l & 0xC0) != 0)
            throw std::runtime_error("Unsupported DNS label type");

        need(pos, l, len);
        if (!name.empty()) name += '.';
        name.append(reinterpret_cast<const char*>(buf + pos), l);
        pos += l;
    }

    if (!jumped) off = pos;
    return name;
}

std::vector<const DnsAnswer*> DnsPacket::answersOfType(DnsRecordType type) const {
    std::vector<const DnsAnswer*> out;
    for (const auto& a : answers)
        if (a.type == type) out.push_back(&a);
    return out;
}

DnsPacket parseDnsResponse(const uint8_t* buf, size_t len) {
    DnsPacket pkt{};
    size_t off = 0;

    pkt.id = read16(buf, off, len);
    uint16_t flags = read16(buf, off, len);
    pkt.rcode = static_cast<DnsResponseCode>(flags & 0x000F);

    uint16_t qd = read16(buf, off, len);
    uint16_t an = read16(buf, off, len);
    read16(buf, off, len); // NS
    read16(buf, off, len); // AR

    for (int i = 0; i < qd; i++) {
        readName(buf, off, len);
        need(off, 4, len);
        off += 4;
    }

    for (int i = 0; i < an; i++) {
        DnsAnswer a;
        a.name = readName(buf, off, len);
        a.type = static_cast<DnsRecordType>(read16(buf, off, len));
        read16(buf, off, len); // class
        a.ttl = read32(buf, off, len);
        uint16_t rdlen = read16(buf, off, len);
        need(off, rdlen, len);
        size_t end = off + rdlen;

        if (a.type == DnsRecordType::A && rdlen == 4) {
            char ip[16];
            snprintf(ip, sizeof(ip), "%u.%u.%u.%u",
                     buf[off], buf[off+1], buf[off+2], buf[off+3]);
            a.data = ip;
        } else if (a.type == DnsRecordType::AAAA && rdlen == 16) {
            char ip[INET6_ADDRSTRLEN];
            if (inet_ntop(AF_INET6, buf + off, ip, sizeof(ip)))
                a.data = ip;
        } else if (a.type == DnsRecordType::TXT || a.type == DnsRecordType::SPF) {
            size_t p = off;
            while (p < end) {
                uint8_t sl = buf[p++];
                if (p + sl > end)
                    throw std::runtime_error("Truncated DNS character-string");
                a.strings.emplace_back(reinterpret_cast<const char*>(buf + p), sl);
                p += sl;
            }
        } else if (a.type == DnsRecordType::MX) {
            size_t p = off;
            a.preference = read16(buf, p, end);
            a.data = readName(buf, p, len);
        } else if (a.type == DnsRecordType::PTR || a.type == DnsRecordType::CNAME
                   || a.type == DnsRecordType::NS) {
            size_t p = off;
            a.data = readName(buf, p, len);
        }
        off = end;
        pkt.answers.push_back(a);
    }

    return pkt;
}

std::string dnsRecordTypeName(DnsRecordType type) {
    switch (type) {
        case DnsRecordType::A:     return "A";
        case DnsRecordType::NS:    return "NS";
        case DnsRecordType::CNAME: return "CNAME";
        case DnsRecordType::PTR:   return "PTR";
        case DnsRecordType::MX:    return "MX";
        case DnsRecordType::TXT:   return "TXT";
        case DnsRecordType::AAAA:  return "AAAA";
        case DnsRecordType::SPF:   return "SPF";
    }
    return "TYPE" + std::to_string(static_cast<uint16_t>(type));
}

std::string dnsResponseCodeName(DnsResponseCode rcode) {
    switch (rcode) {
        case DnsResponseCode::NoError:  return "NOERROR";
        case DnsResponseCode::FormErr:  return "FORMERR";
        case DnsResponseCode::ServFail: return "SERVFAIL";
        case DnsResponseCode::NxDomain: return "NXDOMAIN";
        case DnsResponseCode::NotImp:   return "NOTIMP";
        case DnsResponseCode::Refused:  return "REFUSED";
    }
    return "RCODE" + std::to_string(static_cast<unsigned>(rcode));
}
