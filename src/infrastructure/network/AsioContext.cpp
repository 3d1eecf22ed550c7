#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace pingsweep::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::debug("Asio worker thread {} started", i);
            ioContext_.run();
            spdlog::debug("Asio worker thread {} stopped", i);
        });
    }

    spdlog::debug("AsioContext started with {} worker threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        signals_.reset();
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Only touched once no worker can be inside a signal handler.
    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
        signals_.reset();
    }

    ioContext_.restart();
    spdlog::debug("AsioContext stopped");
}

void AsioContext::abandon() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
    threads_.clear();
    spdlog::warn("AsioContext abandoned with workers still busy");
}

void AsioContext::onSignals(std::initializer_list<int> signalNumbers, SignalHandler handler) {
    signals_ = std::make_unique<asio::signal_set>(ioContext_);
    for (int signalNumber : signalNumbers) {
        signals_->add(signalNumber);
    }
    signalHandler_ = std::move(handler);
    waitForSignal();
}

void AsioContext::waitForSignal() {
    signals_->async_wait([this](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}", signalNumber);
        if (signalHandler_) {
            signalHandler_(signalNumber);
        }
        if (running_ && signals_) {
            waitForSignal();
        }
    });
}

} // namespace pingsweep::infra
