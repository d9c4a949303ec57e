#include "feedlink/resilience/retry_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "feedlink/resilience/retry_policy.hpp"

namespace feedlink {

    RetryLoop::RetryLoop(const RetryPolicy& policy, RateLimiter& limiter,
                         CircuitBreaker& breaker, std::string origin)
        : policy_(policy),
          limiter_(limiter),
          breaker_(breaker),
          origin_(std::move(origin)),
          max_attempts_(std::max<std::size_t>(policy.max_attempts, 1)) {}

    RetryLoop::~RetryLoop() {
        if (trial_ && !reported_) breaker_.release_trial();
    }

    void RetryLoop::report_success() {
        reported_ = true;
        breaker_.record_success();
    }

    void RetryLoop::report_failure() {
        reported_ = true;
        breaker_.record_failure();
    }

    std::optional<Error> RetryLoop::begin() {
        const auto decision = breaker_.admit();
        if (decision != CircuitBreaker::Decision::Rejected) {
            trial_ = decision == CircuitBreaker::Decision::Trial;
            return std::nullopt;
        }

        SPDLOG_DEBUG("{} rejected by open circuit", origin_);
        Error e{Error::Code::CircuitOpen, "circuit open, no attempt made"};
        e.origin = origin_;
        e.attempts = 0;
        return e;
    }

    RateLimiter::Admission RetryLoop::admit() {
        auto adm = limiter_.try_acquire();
        if (!adm.granted) limiter_wait_ += adm.wait_hint;
        return adm;
    }

    RetryLoop::Step RetryLoop::on_outcome(Result<Response> outcome) {
        ++attempts_;

        if (outcome.has_error()) {
            Error err = std::move(outcome).error();
            SPDLOG_DEBUG("{} attempt {}/{} failed: {}", origin_, attempts_,
                         max_attempts_, err.message);
            if (err.is_network() || err.code == Error::Code::Timeout)
                return transient(std::move(err), nullptr);
            return finish_err(std::move(err), true);
        }

        Response& res = outcome.value();
        SPDLOG_DEBUG("{} attempt {}/{} -> {}", origin_, attempts_,
                     max_attempts_, res.status_code);

        if (res.ok()) {
            report_success();
            res.attempts = attempts_;
            final_.emplace(Result<Response>::ok(std::move(res)));
            return {true, {}};
        }

        Error err{Error::Code::HttpStatus,
                  "HTTP status " + std::to_string(res.status_code)};
        err.status_code = res.status_code;

        if (is_retryable_status(policy_, res.status_code))
            return transient(std::move(err), &res);
        return finish_err(std::move(err), true);
    }

    RetryLoop::Step RetryLoop::transient(Error err, const Response* response) {
        if (policy_.count_transient_failures) {
            report_failure();
            if (breaker_.state() == CircuitState::Open &&
                attempts_ < max_attempts_) {
                Error e{Error::Code::CircuitOpen,
                        "circuit opened during retries: " + err.message};
                e.cause = err.code;
                e.status_code = err.status_code;
                return finish_err(std::move(e), false);
            }
        }

        if (attempts_ >= max_attempts_) {
            Error e{Error::Code::RetryExhausted,
                    "gave up after " + std::to_string(attempts_) +
                        " attempts: " + err.message};
            e.cause = err.code;
            e.status_code = err.status_code;
            return finish_err(std::move(e), !policy_.count_transient_failures);
        }

        auto delay = backoff_delay(policy_, attempts_);
        if (response != nullptr) {
            if (auto ra = retry_after_delay(policy_, *response))
                delay = std::max(delay, *ra);
        }

        SPDLOG_WARN("{} attempt {}/{} failed ({}), retrying in {} ms", origin_,
                    attempts_, max_attempts_, err.message, delay.count());
        return {false, delay};
    }

    RetryLoop::Step RetryLoop::finish_err(Error err, bool report) {
        if (report) report_failure();
        err = decorate(std::move(err));
        SPDLOG_ERROR("{}", err.describe());
        final_.emplace(Result<Response>::err(std::move(err)));
        return {true, {}};
    }

    Error RetryLoop::decorate(Error err) const {
        if (err.origin.empty()) err.origin = origin_;
        err.attempts = attempts_;
        return err;
    }

    Result<Response> RetryLoop::take_result() {
        if (!final_) {
            return Result<Response>::err(
                decorate(Error{Error::Code::Unknown, "retry loop not finished"}));
        }
        auto out = std::move(*final_);
        final_.reset();
        return out;
    }

}  // namespace feedlink
