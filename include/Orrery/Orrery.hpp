#pragma once

// Orrery - Entity Component System coordination layer
// This header includes all Orrery headers in dependency order

// Core headers
#include "Core/Platform.hpp"
#include "Core/Base.hpp"
#include "Core/Config.hpp"

// Core utilities
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Delegate.hpp"
#include "Core/Log.hpp"
#include "Core/TypeID.hpp"

// Container types
#include "Container/Bitmap.hpp"

// Entity handles
#include "Entity/Entity.hpp"
#include "Entity/HandlePool.hpp"

// Component system
#include "Component/Component.hpp"
#include "Component/ComponentBag.hpp"
#include "Component/ComponentRegistry.hpp"

// Aspects and systems
#include "Aspect/Aspect.hpp"
#include "System/System.hpp"

// Command buffer
#include "Commands/CommandTypes.hpp"
#include "Commands/CommandBuffer.hpp"

// World
#include "World/World.hpp"
