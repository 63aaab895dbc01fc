/**
 * @file composition_event.hpp
 * @brief Notifications emitted by the Composer: CompositionEvent, IEventSink, EventLog.
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"

namespace composa
{

/**
 * @brief The three mutating operations of every resource family.
 */
enum class CompositionOperation
{
    Link,
    UpdateTarget,
    Unlink
};

inline const char* to_string(CompositionOperation operation) noexcept
{
    switch (operation)
    {
    case CompositionOperation::Link:
        return "Link";
    case CompositionOperation::UpdateTarget:
        return "UpdateTarget";
    case CompositionOperation::Unlink:
        return "Unlink";
    }
    return "Unknown";
}

/**
 * @brief Structured notification for one successful mutating operation.
 *
 * @details
 * Exactly one event is emitted per successful operation.
 *
 * | kind        | operation    | source        | resource | amount | target     | recipient |
 * |-------------|--------------|---------------|----------|--------|------------|-----------|
 * | NonFungible | Link         | linked node   | -        | 0      | new target | -         |
 * | NonFungible | UpdateTarget | linked node   | -        | 0      | new target | -         |
 * | NonFungible | Unlink       | linked node   | -        | 0      | -          | recipient |
 * | Currency / CountedAsset | Link | -         | key      | moved  | new owner  | -         |
 * | Currency / CountedAsset | UpdateTarget | old owner | key | moved | new owner | -       |
 * | Currency / CountedAsset | Unlink | old owner | key    | moved  | -          | recipient |
 */
struct CompositionEvent
{
    CompositionOperation operation{CompositionOperation::Link};
    ResourceKind kind{ResourceKind::NonFungible};

    /// The acting caller.
    Address actor;

    /// The node being linked, or the node an attachment leaves.
    std::optional<NodeId> source;

    /// The attachment's resource, for Currency and CountedAsset.
    std::optional<ResourceKey> resource;

    /// Quantity moved, for Currency and CountedAsset; 0 otherwise.
    Amount amount{0};

    /// Resulting target, for Link and UpdateTarget.
    std::optional<NodeId> target;

    /// Custody recipient, for Unlink.
    std::optional<Address> recipient;

    /// Caller-supplied opaque bytes.
    Bytes annotation;
};

/**
 * @brief Receiver of composition notifications.
 *
 * @details
 * Sinks are called after the operation has committed. A sink must not call
 * back into the mutating surface of the emitting Composer. An exception
 * thrown by a sink is logged and does not reach the caller of the operation,
 * and the remaining sinks still receive the event.
 */
class IEventSink
{
public:
    virtual ~IEventSink() = default;

    virtual void on_event(const CompositionEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<IEventSink>;

/**
 * @brief Sink that records every event in emission order.
 */
class EventLog : public IEventSink
{
public:
    void on_event(const CompositionEvent& event) override
    {
        m_events.push_back(event);
    }

    const std::vector<CompositionEvent>& events() const noexcept
    {
        return m_events;
    }

    size_t size() const noexcept
    {
        return m_events.size();
    }

    void clear() noexcept
    {
        m_events.clear();
    }

private:
    std::vector<CompositionEvent> m_events;
};

} // namespace composa
