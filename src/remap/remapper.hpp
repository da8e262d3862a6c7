#pragma once

#include "core/command.hpp"
#include "core/location_table.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace SimonSays {

enum class ConfirmationKind {
    Adopt,          // use the clicked point
    KeepOriginal    // keep the old coordinates
};

struct Confirmation {
    ConfirmationKind kind = ConfirmationKind::KeepOriginal;
    Point point;
};

// Delivers the user's answer for one location
class ConfirmationSource {
public:
    virtual ~ConfirmationSource() = default;

    // Block until an answer arrives. nullopt means the remap was cancelled.
    virtual std::optional<Confirmation> await() = 0;
};

/**
 * Hand-off between the hook thread and the remap worker.
 *
 * offer() is called from the hook callback and never blocks for long. It is
 * accepted only while a worker sits in await() and no answer is pending, so a
 * click that arrives between two prompts is refused and the hook lets it
 * through to the desktop.
 */
class ConfirmationChannel : public ConfirmationSource {
public:
    bool offer(const Confirmation& confirmation);
    std::optional<Confirmation> await() override;

    // Wake a waiting worker with a cancellation and refuse all later offers
    void close();

    bool isWaiting() const;
    bool isClosed() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<Confirmation> m_pending;
    bool m_waiting = false;
    bool m_closed = false;
};

// Shows the user where a location used to be
class RemapPrompt {
public:
    virtual ~RemapPrompt() = default;

    // original is empty when the old table has no entry for name
    virtual void show(const std::string& name, std::optional<Point> original) = 0;
    virtual void hide() = 0;
};

/**
 * Re-collects the coordinates of every location a script references, for a
 * different screen. The script itself is never changed.
 */
class Remapper {
public:
    Remapper(const Script& script, const LocationTable& original);

    // Distinct location names in first-use order
    const std::vector<std::string>& referencedNames() const { return m_names; }

    // Visit every referenced name once. Names the script never uses keep
    // their old coordinates. Returns nullopt when the source cancels.
    std::optional<LocationTable> run(ConfirmationSource& source, RemapPrompt& prompt);

    // Set callback for progress messages
    using StatusCallback = std::function<void(const std::string& status)>;
    void setStatusCallback(StatusCallback callback);

private:
    const LocationTable& m_original;
    std::vector<std::string> m_names;
    StatusCallback m_statusCallback;

    void sendStatus(const std::string& status);
};

} // namespace SimonSays
