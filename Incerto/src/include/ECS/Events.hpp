#pragma once

#include <ECS/System.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// Events<E>: double-buffered message queue kept as a resource.
//
// Writers append to the current buffer. Update() makes it the readable one
// and starts an empty current buffer, so events sent during one step are
// read during the next, by every reader, and then dropped.
// ---------------------------------------------------------------------------
template<typename E>
class Events {
public:
    void Send(E event) { m_current.push_back(std::move(event)); }

    void Update() {
        std::swap(m_previous, m_current);
        m_current.clear();
    }

    // Events sent before the last Update().
    [[nodiscard]] const std::vector<E>& Readable() const noexcept { return m_previous; }

    // Events sent since the last Update().
    [[nodiscard]] size_t Pending() const noexcept { return m_current.size(); }

private:
    std::vector<E> m_previous;
    std::vector<E> m_current;
};

// System parameter: read the events of the previous step.
template<typename E>
class EventReader {
public:
    explicit EventReader(const Events<E>& events) noexcept : m_events(&events) {}

    [[nodiscard]] const std::vector<E>& Read() const noexcept { return m_events->Readable(); }
    [[nodiscard]] size_t Size() const noexcept { return Read().size(); }
    [[nodiscard]] bool Empty() const noexcept { return Read().empty(); }

    auto begin() const noexcept { return Read().begin(); }
    auto end()   const noexcept { return Read().end(); }

private:
    const Events<E>* m_events;
};

// System parameter: send events readable in the next step.
template<typename E>
class EventWriter {
public:
    explicit EventWriter(Events<E>& events) noexcept : m_events(&events) {}

    void Send(E event) const { m_events->Send(std::move(event)); }

private:
    Events<E>* m_events;
};

namespace detail {

template<typename E>
struct SystemParam<EventReader<E>> {
    static EventReader<E> Fetch(Registry& reg, Commands&) {
        return EventReader<E>(RequireResource<Events<E>>(reg));
    }
    static void Declare(Access& access) { access.Reads<Events<E>>(); }
};

template<typename E>
struct SystemParam<EventWriter<E>> {
    static EventWriter<E> Fetch(Registry& reg, Commands&) {
        return EventWriter<E>(RequireResource<Events<E>>(reg));
    }
    static void Declare(Access& access) { access.Writes<Events<E>>(); }
};

} // namespace detail

} // namespace Incerto::ECS
