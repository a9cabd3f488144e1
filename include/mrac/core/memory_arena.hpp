#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

// // Bump allocator over a caller-owned block: every per-run buffer is carved here during init(),
// // so the tick path never touches the heap
namespace mrac{
    class MemoryArena{
        public:
            MemoryArena(void* base, std::size_t bytes) noexcept
                : base_(static_cast<std::byte*>(base)), cap_(bytes) {}

            MemoryArena(const MemoryArena&) = delete;
            MemoryArena& operator=(const MemoryArena&) = delete;

            void* allocate(std::size_t bytes, std::size_t align = alignof(std::max_align_t)) noexcept{
                if (!base_ || bytes == 0) return nullptr;
                if (align == 0 || (align & (align - 1)) != 0) return nullptr;   // power of 2 only

                const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(base_);
                const std::uintptr_t aligned = (base + offset_ + (align - 1)) & ~(static_cast<std::uintptr_t>(align) - 1u);
                const std::size_t head = static_cast<std::size_t>(aligned - base);

                // // overflow-safe: head + bytes <= cap
                if (head > cap_ || bytes > cap_ - head) return nullptr;

                offset_ = head + bytes;
                return reinterpret_cast<void*>(aligned);
            }

            // // n zero-initialised trivially constructible elements, nullptr when exhausted
            template <class T>
            T* allocate_array(std::size_t n) noexcept{
                static_assert(std::is_trivially_default_constructible_v<T>, "arena holds trivial types only");
                if (n == 0 || n > cap_ / sizeof(T)) return nullptr;
                T* p = static_cast<T*>(allocate(n * sizeof(T), alignof(T)));
                if (p) for (std::size_t i=0; i<n; ++i) p[i] = T{};
                return p;
            }

            void reset() noexcept{
                offset_ = 0;
            }

            // // drops everything carved after `mark` (a previous used()); later marks are ignored
            void rewind(std::size_t mark) noexcept{
                if (mark <= offset_) offset_ = mark;
            }

            std::size_t capacity() const noexcept{
                return cap_;
            }

            std::size_t used() const noexcept{
                return offset_;
            }

            std::size_t remaining() const noexcept{
                return cap_ - offset_;
            }

        private:
            std::byte* base_{nullptr};
            std::size_t offset_{0};
            std::size_t cap_{0};
    };
} // namespace mrac
