#ifndef RETICLE_CANCELLATION_TOKEN_H
#define RETICLE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>
#include <string>
#include <mutex>

namespace reticle {

/**
 * @brief Cooperative cancellation flag shared between a caller and a run
 *
 * The pipeline polls the token at stage boundaries only. Once execution
 * (L6) has started the request is ignored for the rest of that run.
 */
class CancellationToken {
public:
    CancellationToken() : m_cancel_requested(false) {}

    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

    void requestCancel(const std::string& reason = "") {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_cancel_requested) {
                m_reason = reason;
            }
        }
        m_cancel_requested = true;
    }

    bool isCancellationRequested() const {
        return m_cancel_requested.load();
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_reason;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_requested = false;
        m_reason.clear();
    }

private:
    std::atomic<bool> m_cancel_requested;
    mutable std::mutex m_mutex;
    std::string m_reason;
};

} // namespace reticle

#endif // RETICLE_CANCELLATION_TOKEN_H
