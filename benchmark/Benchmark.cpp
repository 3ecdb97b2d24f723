#include <Orrery/Orrery.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

struct Position
{
    float x;
    float y;
};

struct Velocity
{
    float dx;
    float dy;
};

struct Frozen {};

template<int N>
struct Comp
{
    int x;
};

static Orrery::WorldConfig QuietConfig(std::size_t entities)
{
    Orrery::WorldConfig config;
    config.entityCapacity = entities;
    config.logLevel = Orrery::LogLevel::Off;
    return config;
}

static std::vector<Orrery::Entity> Populate(Orrery::World& world, std::size_t count)
{
    std::vector<Orrery::Entity> entities;
    entities.reserve(count);
    for(std::size_t i = 0; i < count; ++i)
    {
        Orrery::Entity entity = world.CreateEntityWith(Position{0.0f, 0.0f});
        if (i % 2 == 0)
        {
            world.AddComponent<Velocity>(entity, 1.0f, 1.0f);
        }
        if (i % 7 == 0)
        {
            world.AddComponent<Frozen>(entity);
        }
        entities.push_back(entity);
    }
    return entities;
}

static void BM_CreateEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Orrery::World world(QuietConfig(count));
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(world.CreateEntity());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_AspectMatch(benchmark::State& state)
{
    Orrery::Aspect aspect = Orrery::Aspect::Make<
        Orrery::Required<Position, Velocity>,
        Orrery::Excluded<Frozen>,
        Orrery::OneOf<Comp<0>, Comp<1>, Comp<2>>>();

    Orrery::ComponentBag bag;
    bag.Emplace<Position>();
    bag.Emplace<Velocity>();
    bag.Emplace<Comp<2>>();

    for(auto _ : state)
    {
        benchmark::DoNotOptimize(aspect.Matches(bag));
    }
}

// Entity sync: every entity is admitted against a schedule of eight systems
static void BM_SyncEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Orrery::World world(QuietConfig(count));
        for(int i = 0; i < 4; ++i)
        {
            world.AddSystem(Orrery::System(Orrery::Aspect::Make<Orrery::Required<Position>>()));
            world.AddSystem(Orrery::System(Orrery::Aspect::Make<Orrery::Required<Position, Velocity>, Orrery::Excluded<Frozen>>()));
        }
        world.SyncSystems();
        for(Orrery::Entity entity : Populate(world, count))
        {
            world.Enqueue(entity);
        }
        state.ResumeTiming();

        world.SyncEntities();
        benchmark::DoNotOptimize(world.GetEntityCount());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// System sync: a new system is populated from an already resident set
static void BM_SyncSystems(benchmark::State& state)
{
    const size_t count = state.range(0);
    Orrery::World world(QuietConfig(count));
    for(Orrery::Entity entity : Populate(world, count))
    {
        world.Enqueue(entity);
    }
    world.SyncEntities();

    for(auto _ : state)
    {
        Orrery::SystemHandle handle = world.AddSystem(Orrery::System(
            Orrery::Aspect::Make<Orrery::Required<Position, Velocity>>()));
        world.SyncSystems();
        benchmark::DoNotOptimize(world.GetMembers(handle));

        state.PauseTiming();
        static_cast<void>(world.DestroySystem(handle));
        world.SyncSystems();
        state.ResumeTiming();
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_UpdateMovement(benchmark::State& state)
{
    const size_t count = state.range(0);
    Orrery::World world(QuietConfig(count));

    Orrery::System movement("movement", Orrery::Aspect::Make<Orrery::Required<Position, Velocity>>());
    movement.OnUpdate([&world](Orrery::Entity entity, float dt)
    {
        Position* position = world.GetComponent<Position>(entity);
        const Velocity* velocity = world.GetComponent<Velocity>(entity);
        position->x += velocity->dx * dt;
        position->y += velocity->dy * dt;
    });
    world.AddSystem(std::move(movement));

    for(Orrery::Entity entity : Populate(world, count))
    {
        world.Enqueue(entity);
    }
    world.Update(0.0f);

    for(auto _ : state)
    {
        world.Update(1.0f / 60.0f);
    }

    state.SetItemsProcessed(state.iterations() * (count / 2));
}

// Re-enqueueing every resident entity each frame
static void BM_ReenqueueAll(benchmark::State& state)
{
    const size_t count = state.range(0);
    Orrery::World world(QuietConfig(count));
    world.AddSystem(Orrery::System(Orrery::Aspect::Make<Orrery::Required<Position>>()));
    world.AddSystem(Orrery::System(Orrery::Aspect::Make<Orrery::Required<Velocity>>()));

    std::vector<Orrery::Entity> entities = Populate(world, count);
    for(Orrery::Entity entity : entities)
    {
        world.Enqueue(entity);
    }
    world.Update(0.0f);

    for(auto _ : state)
    {
        for(Orrery::Entity entity : entities)
        {
            world.Enqueue(entity);
        }
        world.Update(0.0f);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_CreateEntities)->Arg(10000)->Arg(100000);
BENCHMARK(BM_AspectMatch);
BENCHMARK(BM_SyncEntities)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(BM_SyncSystems)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(BM_UpdateMovement)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(BM_ReenqueueAll)->Arg(1000)->Arg(10000)->Arg(100000);

BENCHMARK_MAIN();
