#pragma once

#include <ECS/Entity.hpp>

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace Incerto::ECS {

// ---------------------------------------------------------------------------
// IPool: type-erased base for ComponentPool<T>.
//
// Lets the Registry strip or wipe a pool without knowing its record type,
// and lets queries pick the smallest pool to drive an intersection.
// ---------------------------------------------------------------------------
struct IPool {
    virtual ~IPool() = default;

    // Remove the record owned by the given slot (no-op if absent).
    virtual void Remove(uint32_t entityIdx) = 0;

    // Drop every record.
    virtual void Clear() = 0;

    [[nodiscard]] virtual size_t Size() const = 0;

    [[nodiscard]] virtual bool Has(uint32_t entityIdx) const = 0;

    // Packed slot indices, parallel to the record array.
    // Invalidated by any Emplace / Remove.
    [[nodiscard]] virtual const std::vector<uint32_t>& EntityIndices() const = 0;
};

// ---------------------------------------------------------------------------
// ComponentPool<T>: sparse-set storage for one component type.
//
//   m_sparse  slot index → dense position, or EMPTY
//   m_dense   dense position → slot index
//   m_data    dense position → record
//
// Add / Remove / Has / Get are O(1); removal swaps the last record into the
// hole so the record array stays packed. Iteration over m_data is in
// insertion order until the first removal.
// ---------------------------------------------------------------------------
template<typename T>
class ComponentPool final : public IPool {
public:
    void Remove(uint32_t entityIdx) override {
        if (!Has(entityIdx)) return;

        const uint32_t hole = m_sparse[entityIdx];
        const uint32_t last = static_cast<uint32_t>(m_dense.size()) - 1u;

        if (hole != last) {
            const uint32_t moved = m_dense[last];
            m_dense[hole]        = moved;
            m_data[hole]         = std::move(m_data[last]);
            m_sparse[moved]      = hole;
        }

        m_dense.pop_back();
        m_data.pop_back();
        m_sparse[entityIdx] = EMPTY;
    }

    void Clear() override {
        m_sparse.clear();
        m_dense.clear();
        m_data.clear();
    }

    [[nodiscard]] size_t Size() const override { return m_dense.size(); }

    [[nodiscard]] bool Has(uint32_t entityIdx) const override {
        return entityIdx < m_sparse.size() && m_sparse[entityIdx] != EMPTY;
    }

    [[nodiscard]] const std::vector<uint32_t>& EntityIndices() const override {
        return m_dense;
    }

    // Construct a T in place for the given slot.
    // The slot must not already own a T.
    template<typename... Args>
    T& Emplace(uint32_t entityIdx, Args&&... args) {
        if (entityIdx >= m_sparse.size())
            m_sparse.resize(entityIdx + 1, EMPTY);

        assert(!Has(entityIdx) && "ComponentPool::Emplace: slot already owns this component");

        m_sparse[entityIdx] = static_cast<uint32_t>(m_dense.size());
        m_dense.push_back(entityIdx);
        if constexpr (std::is_aggregate_v<T>)
            m_data.push_back(T{std::forward<Args>(args)...});
        else
            m_data.emplace_back(std::forward<Args>(args)...);
        return m_data.back();
    }

    [[nodiscard]] T& Get(uint32_t entityIdx) {
        assert(Has(entityIdx) && "ComponentPool::Get: slot does not own this component");
        return m_data[m_sparse[entityIdx]];
    }
    [[nodiscard]] const T& Get(uint32_t entityIdx) const {
        assert(Has(entityIdx) && "ComponentPool::Get: slot does not own this component");
        return m_data[m_sparse[entityIdx]];
    }

private:
    static constexpr uint32_t EMPTY = ~0u;

    std::vector<uint32_t> m_sparse;
    std::vector<uint32_t> m_dense;
    std::vector<T>        m_data;
};

} // namespace Incerto::ECS
