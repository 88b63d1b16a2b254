#include "dns_checker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <resolv.h>
#include <algorithm>
#include <cstring>

namespace {

enum class QueryOutcome {
    Answered,
    NoData,     // NXDOMAIN or empty answer section
    Failed      // timeout or server failure
};

class ResolverState {
public:
    explicit ResolverState(int timeout_ms) {
        std::memset(&state_, 0, sizeof(state_));
        ok_ = res_ninit(&state_) == 0;
        if (ok_) {
            state_.retrans = std::max(1, timeout_ms / 1000);
            state_.retry = 1;
        }
    }

    ~ResolverState() {
        if (ok_) res_nclose(&state_);
    }

    ResolverState(const ResolverState&) = delete;
    ResolverState& operator=(const ResolverState&) = delete;

    bool ok() const { return ok_; }
    res_state get() { return &state_; }

private:
    struct __res_state state_;
    bool ok_ = false;
};

QueryOutcome query(ResolverState& resolver, const std::string& domain, int type) {
    unsigned char answer[NS_PACKETSZ * 8];

    int len = res_nquery(resolver.get(), domain.c_str(), ns_c_in, type,
                         answer, sizeof(answer));
    if (len < 0) {
        int herr = resolver.get()->res_h_errno;
        return (herr == HOST_NOT_FOUND || herr == NO_DATA) ? QueryOutcome::NoData
                                                          : QueryOutcome::Failed;
    }

    ns_msg msg;
    if (ns_initparse(answer, len, &msg) < 0) {
        return QueryOutcome::Failed;
    }
    return ns_msg_count(msg, ns_s_an) > 0 ? QueryOutcome::Answered : QueryOutcome::NoData;
}

} // namespace

DnsChecker::DnsChecker(int timeout_ms)
    : timeout_ms_(timeout_ms) {}

std::string DnsChecker::extract_tld(const std::string& domain) {
    size_t dot = domain.rfind('.');
    if (dot == std::string::npos) return "";
    return util::to_lower(domain.substr(dot));
}

DnsResult DnsChecker::check(const std::string& domain) const {
    DnsResult result;
    result.tld = extract_tld(domain);
    result.checked_at = util::current_iso8601();

    ResolverState resolver(timeout_ms_);
    if (!resolver.ok()) {
        result.error = "Failed to initialise resolver";
        spdlog::warn("DNS check for {} skipped: resolver init failed", domain);
        return result;
    }

    struct RecordCheck {
        const char* label;
        std::vector<int> types;
    };
    const RecordCheck checks[] = {
        {"A", {ns_t_a, ns_t_aaaa}},
        {"MX", {ns_t_mx}},
        {"NS", {ns_t_ns}},
        {"TXT", {ns_t_txt}},
    };

    int failures = 0;
    int attempts = 0;
    for (const auto& check : checks) {
        bool answered = false;
        for (int type : check.types) {
            attempts++;
            QueryOutcome outcome = query(resolver, domain, type);
            if (outcome == QueryOutcome::Failed) failures++;
            if (outcome == QueryOutcome::Answered) {
                answered = true;
                break;
            }
        }
        if (answered) {
            result.has_records = true;
            result.record_types.push_back(check.label);
        }
        spdlog::debug("DNS {} {} -> {}", check.label, domain, answered ? "answered" : "none");
    }

    result.available = !result.has_records;

    if (failures == attempts) {
        result.error = "DNS resolver did not answer";
    }

    return result;
}
