#pragma once

// ---------------------------------------------------------------------------
// ECS.hpp: single include for the Incerto entity-component substrate.
//
//   #include <ECS/ECS.hpp>
//   using namespace Incerto::ECS;
//
// Overview
// --------
//
//   Entity         uint32_t handle (index + generation)
//   ComponentPool  sparse-set storage per record type
//   Registry       entities, records, queries, resources
//   Filter         With<...> / Without<...> presence filters
//   Commands       deferred structural changes issued by systems
//   System         update routine with declared Access; MakeSystem
//   Events         double-buffered events; EventReader / EventWriter
//   Scheduler      batches disjoint systems, one barrier per batch
//
// Quick-start
// -----------
//
//   Registry reg;
//   reg.Spawn(Counter{0}, GroupA{});
//
//   Scheduler sched(4);
//   sched.AddSystem(MakeSystem("tick", [](Query<Counter> q) {
//       q.Each([](EntityId, Counter& c) { ++c.value; });
//   }));
//
//   sched.RunStep(reg);
// ---------------------------------------------------------------------------

#include <ECS/Entity.hpp>
#include <ECS/ComponentPool.hpp>
#include <ECS/Filter.hpp>
#include <ECS/Registry.hpp>
#include <ECS/Commands.hpp>
#include <ECS/System.hpp>
#include <ECS/Events.hpp>
#include <ECS/Scheduler.hpp>
