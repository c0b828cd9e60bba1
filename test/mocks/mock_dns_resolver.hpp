#pragma once

#include <peppol_lookup/sml/i_dns_resolver.hpp>

#include <deque>
#include <string>
#include <vector>

namespace peppol_lookup {
namespace testing {

// ---------------------------------------------------------------------------
// MockDnsResolver — hand-written mock for offline SML tests.
//
// Usage:
//   MockDnsResolver dns;
//   dns.EnqueueAddresses({"192.0.2.10"});
//   auto result = ResolveParticipant(dns, participant, "sml.example");
//   CHECK(dns.Calls()[0] == "b-...iso6523-actorid-upis.sml.example");
//
// Answers are consumed FIFO. An empty queue answers with a NotFound error,
// the same as an unregistered name.
// ---------------------------------------------------------------------------
class MockDnsResolver : public IDnsResolver {
public:
    MockDnsResolver() = default;

    void Enqueue(Result<std::vector<std::string>, Error> answer) {
        answers_.push_back(std::move(answer));
    }

    void EnqueueAddresses(std::vector<std::string> addresses) {
        Enqueue(Result<std::vector<std::string>, Error>::Ok(std::move(addresses)));
    }

    void EnqueueFailure(ErrorCategory category, const std::string& message) {
        Enqueue(Result<std::vector<std::string>, Error>::Err(Error{
            "ResolveAddresses", "", std::nullopt, message, category}));
    }

    [[nodiscard]] const std::vector<std::string>& Calls() const noexcept {
        return calls_;
    }
    [[nodiscard]] size_t CallCount() const noexcept { return calls_.size(); }

    Result<std::vector<std::string>, Error> ResolveAddresses(
        std::string_view hostname) override {
        calls_.emplace_back(hostname);
        if (answers_.empty()) {
            return Result<std::vector<std::string>, Error>::Err(Error{
                "ResolveAddresses", std::string(hostname), std::nullopt,
                "MockDnsResolver: no answers enqueued", ErrorCategory::NotFound});
        }
        auto answer = std::move(answers_.front());
        answers_.pop_front();
        return answer;
    }

private:
    std::deque<Result<std::vector<std::string>, Error>> answers_;
    std::vector<std::string> calls_;
};

} // namespace testing
} // namespace peppol_lookup
