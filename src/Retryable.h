// Retryable.h
#pragma once

#include <QDebug>
#include <QString>

// Calls fn() up to `tries` times. Only exceptions of type Retry (or derived)
// trigger another attempt; the last one is rethrown once tries run out.
// Anything else escapes on the first occurrence.
template <typename Retry, typename Fn>
auto retryable(int tries, const char* tag, Fn&& fn) -> decltype(fn())
{
    if (tries < 1) tries = 1;

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const Retry& e) {
            if (attempt >= tries) {
                qWarning().noquote() << QString("[%1] giving up after %2 attempt(s): %3")
                                        .arg(QLatin1String(tag))
                                        .arg(attempt)
                                        .arg(QString::fromLocal8Bit(e.what()));
                throw;
            }
            qInfo().noquote() << QString("[%1] attempt %2/%3 failed, retrying: %4")
                                 .arg(QLatin1String(tag))
                                 .arg(attempt)
                                 .arg(tries)
                                 .arg(QString::fromLocal8Bit(e.what()));
        }
    }
}
