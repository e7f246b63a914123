#pragma once

#include <atomic>

#include <QDeadlineTimer>
#include <QString>

#include "auth/AuthError.hpp"

namespace gsuite::core::oauth {

struct CallbackResult {
    QString code;
    QString state;
};

// Single-use loopback endpoint for the provider redirect.
//
// AwaitRedirect binds 127.0.0.1:<port> (and [::1]:<port> where the host has IPv6) on a
// worker thread and waits for GET <path>?code=..&state=.. (or ?error=..). Every browser
// request gets a static HTML page. The first request that carries code or error ends the
// wait; other paths get 404, requests without code/error get 400, and both keep the
// listener waiting.
//
// Outcomes: true + out (redirect with code); false with
//   PortUnavailable  port taken (not retried)
//   ProviderError    redirect carried ?error=<detail>
//   Timeout          deadline passed
//   Cancelled        Cancel() was called
//   NetworkError     the listening socket failed
// The worker thread is joined and the port released before AwaitRedirect returns.
class CallbackListener {
public:
    CallbackListener() = default;

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    bool AwaitRedirect(quint16 port,
                       const QString& path,
                       QDeadlineTimer deadline,
                       CallbackResult& out,
                       gsuite::auth::AuthError& outError);

    // Safe from any thread, before or during AwaitRedirect. Sticky.
    void Cancel();
    bool IsCancelled() const;

    // Granularity of the accept wait, and therefore the cancel latency.
    static constexpr int kPollSliceMs = 50;

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace gsuite::core::oauth
