#include "remapper.hpp"

#include <algorithm>
#include <sstream>

namespace SimonSays {

bool ConfirmationChannel::offer(const Confirmation& confirmation) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || !m_waiting || m_pending) {
            return false;
        }
        m_pending = confirmation;
    }
    m_cv.notify_one();
    return true;
}

std::optional<Confirmation> ConfirmationChannel::await() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_closed) {
        return std::nullopt;
    }

    m_waiting = true;
    m_cv.wait(lock, [this] { return m_pending.has_value() || m_closed; });
    m_waiting = false;

    std::optional<Confirmation> result;
    if (m_pending && !m_closed) {
        result = m_pending;
    }
    m_pending.reset();
    return result;
}

void ConfirmationChannel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool ConfirmationChannel::isWaiting() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting && !m_pending;
}

bool ConfirmationChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

Remapper::Remapper(const Script& script, const LocationTable& original) : m_original(original) {
    for (const auto& command : script) {
        for (const auto& name : referencedLocations(command)) {
            if (std::find(m_names.begin(), m_names.end(), name) == m_names.end()) {
                m_names.push_back(name);
            }
        }
    }
}

void Remapper::setStatusCallback(StatusCallback callback) {
    m_statusCallback = std::move(callback);
}

void Remapper::sendStatus(const std::string& status) {
    if (m_statusCallback) {
        m_statusCallback(status);
    }
}

std::optional<LocationTable> Remapper::run(ConfirmationSource& source, RemapPrompt& prompt) {
    // Unreferenced names carry over as they are
    LocationTable remapped = m_original;

    for (size_t i = 0; i < m_names.size(); ++i) {
        const std::string& name = m_names[i];
        std::optional<Point> original = m_original.find(name);

        std::ostringstream status;
        status << "[" << (i + 1) << "/" << m_names.size() << "] " << name;
        if (original) {
            status << " was at (" << original->x << ", " << original->y << ")";
        } else {
            status << " has no saved position";
        }
        sendStatus(status.str());

        prompt.show(name, original);
        std::optional<Confirmation> answer = source.await();
        prompt.hide();

        if (!answer) {
            sendStatus("Remap cancelled");
            return std::nullopt;
        }

        if (answer->kind == ConfirmationKind::Adopt) {
            remapped.set(name, answer->point);
            sendStatus("  " + name + " -> (" + std::to_string(answer->point.x) + ", "
                       + std::to_string(answer->point.y) + ")");
        } else if (original) {
            sendStatus("  " + name + " kept");
        } else {
            sendStatus("  " + name + " left without a position");
        }
    }

    return remapped;
}

} // namespace SimonSays
