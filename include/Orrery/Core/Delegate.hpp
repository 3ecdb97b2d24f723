#pragma once

#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"

namespace Orrery
{
    template<typename Signature>
    class Delegate;

    /**
     * Copyable type-erased callable used for system hooks and log sinks.
     *
     * Functors up to SmallBufferSize bytes that are nothrow-movable live inline,
     * larger ones are held through a shared_ptr so copies stay cheap.
     * An empty delegate converts to false; calling it is a debug assertion.
     */
    template<typename R, typename... Args>
    class Delegate<R(Args...)>
    {
    public:
        using ResultType = R;

        static constexpr std::size_t SmallBufferSize = 32;

        Delegate() noexcept = default;

        Delegate(std::nullptr_t) noexcept {}

        template<typename Func>
            requires (!std::is_same_v<std::decay_t<Func>, Delegate> &&
                      std::is_invocable_r_v<R, const std::decay_t<Func>&, Args...>)
        Delegate(Func&& func)
        {
            using Decayed = std::decay_t<Func>;

            if constexpr (std::is_pointer_v<std::remove_reference_t<Func>>)
            {
                if (func == nullptr)
                    return;
            }

            if constexpr (sizeof(Decayed) <= SmallBufferSize &&
                          alignof(Decayed) <= alignof(std::max_align_t) &&
                          std::is_nothrow_move_constructible_v<Decayed>)
            {
                ::new (static_cast<void*>(m_storage)) Decayed(std::forward<Func>(func));
                m_ops = &InlineOps<Decayed>::table;
            }
            else
            {
                using Shared = std::shared_ptr<Decayed>;
                ::new (static_cast<void*>(m_storage)) Shared(std::make_shared<Decayed>(std::forward<Func>(func)));
                m_ops = &SharedOps<Decayed>::table;
            }
        }

        Delegate(const Delegate& other) : m_ops(other.m_ops)
        {
            if (m_ops)
                m_ops->copy(m_storage, other.m_storage);
        }

        Delegate(Delegate&& other) noexcept : m_ops(other.m_ops)
        {
            if (m_ops)
            {
                m_ops->move(m_storage, other.m_storage);
                other.m_ops = nullptr;
            }
        }

        ~Delegate()
        {
            Reset();
        }

        Delegate& operator=(const Delegate& other)
        {
            if (this != &other)
            {
                Delegate copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        Delegate& operator=(Delegate&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_ops = other.m_ops;
                if (m_ops)
                {
                    m_ops->move(m_storage, other.m_storage);
                    other.m_ops = nullptr;
                }
            }
            return *this;
        }

        Delegate& operator=(std::nullptr_t) noexcept
        {
            Reset();
            return *this;
        }

        R operator()(Args... args) const
        {
            ORRERY_ASSERT(m_ops != nullptr, "Calling empty delegate");
            return m_ops->invoke(m_storage, std::forward<Args>(args)...);
        }

        explicit operator bool() const noexcept
        {
            return m_ops != nullptr;
        }

        void Reset() noexcept
        {
            if (m_ops)
            {
                m_ops->destroy(m_storage);
                m_ops = nullptr;
            }
        }

    private:
        struct Ops
        {
            R (*invoke)(const std::byte*, Args...);
            void (*copy)(std::byte*, const std::byte*);
            void (*move)(std::byte*, std::byte*) noexcept;
            void (*destroy)(std::byte*) noexcept;
        };

        template<typename Func>
        struct InlineOps
        {
            static const Func& Get(const std::byte* storage) noexcept
            {
                return *std::launder(reinterpret_cast<const Func*>(storage));
            }

            static R Invoke(const std::byte* storage, Args... args)
            {
                return Get(storage)(std::forward<Args>(args)...);
            }

            static void Copy(std::byte* dst, const std::byte* src)
            {
                ::new (static_cast<void*>(dst)) Func(Get(src));
            }

            static void Move(std::byte* dst, std::byte* src) noexcept
            {
                Func* from = std::launder(reinterpret_cast<Func*>(src));
                ::new (static_cast<void*>(dst)) Func(std::move(*from));
                from->~Func();
            }

            static void Destroy(std::byte* storage) noexcept
            {
                std::launder(reinterpret_cast<Func*>(storage))->~Func();
            }

            static constexpr Ops table{&Invoke, &Copy, &Move, &Destroy};
        };

        template<typename Func>
        struct SharedOps
        {
            using Shared = std::shared_ptr<Func>;

            static const Shared& Get(const std::byte* storage) noexcept
            {
                return *std::launder(reinterpret_cast<const Shared*>(storage));
            }

            static R Invoke(const std::byte* storage, Args... args)
            {
                return (*Get(storage))(std::forward<Args>(args)...);
            }

            static void Copy(std::byte* dst, const std::byte* src)
            {
                ::new (static_cast<void*>(dst)) Shared(Get(src));
            }

            static void Move(std::byte* dst, std::byte* src) noexcept
            {
                Shared* from = std::launder(reinterpret_cast<Shared*>(src));
                ::new (static_cast<void*>(dst)) Shared(std::move(*from));
                from->~Shared();
            }

            static void Destroy(std::byte* storage) noexcept
            {
                std::launder(reinterpret_cast<Shared*>(storage))->~Shared();
            }

            static constexpr Ops table{&Invoke, &Copy, &Move, &Destroy};
        };

        static_assert(sizeof(std::shared_ptr<int>) <= SmallBufferSize, "shared_ptr must fit the inline buffer");

        alignas(std::max_align_t) std::byte m_storage[SmallBufferSize];
        const Ops* m_ops = nullptr;
    };
}
