#pragma once

// Strata - arena allocators and an entity component system built on them
// This header includes all Strata headers in dependency order

// Core headers - platform, configuration, diagnostics
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Logger.hpp"
#include "Core/Profile.hpp"
#include "Core/TypeID.hpp"
#include "Core/Memory.hpp"

// Container types
#include "Container/Bitmap.hpp"

// Arenas
#include "Memory/Arena.hpp"
#include "Memory/LinearArena.hpp"
#include "Memory/StackArena.hpp"
#include "Memory/PoolArena.hpp"
#include "Memory/FreeListArena.hpp"
#include "Memory/DoubleEndedStackArena.hpp"
#include "Memory/DebugArena.hpp"
#include "Memory/ArenaRegistry.hpp"
#include "Memory/ArenaScope.hpp"

// Entity system
#include "Entity/Entity.hpp"
#include "Entity/EntityManager.hpp"

// Component system
#include "Component/Component.hpp"
#include "Component/ComponentRegistry.hpp"
#include "Component/ComponentStorage.hpp"

// Queries
#include "Query/QueryView.hpp"

// Systems
#include "System/SystemMetadata.hpp"
#include "System/WorkerPool.hpp"
#include "System/SystemExecutor.hpp"
#include "System/SystemScheduler.hpp"

// Deferred commands and the world
#include "Commands/CommandBuffer.hpp"
#include "World/World.hpp"
