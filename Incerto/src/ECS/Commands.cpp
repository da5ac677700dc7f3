#include <ECS/Commands.hpp>

namespace Incerto::ECS {

void Commands::Destroy(EntityId id)
{
    m_ops.emplace_back([id](Registry& reg) { reg.DestroyEntity(id); });
}

void Commands::Apply(Registry& reg)
{
    // Ops may queue nothing new (they only see the Registry), but take the
    // list first so a throwing op leaves this buffer empty.
    auto ops = std::move(m_ops);
    m_ops.clear();
    for (auto& op : ops) op(reg);
}

} // namespace Incerto::ECS
