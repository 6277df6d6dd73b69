#pragma once

#include <atomic>
#include <memory>

// Shared cancel flag. Copies observe the same state; a default-constructed
// token is live and can be cancelled.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};
