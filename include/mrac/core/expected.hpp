#pragma once
#include <new>
#include <utility>
#include <type_traits>

#include "mrac/core/status.hpp"

namespace mrac{

    // // Value-or-Status carrier with in-place storage: no heap, no exceptions
    // // Either holds a T (status() == kOK) or a failure Status
    template <class T>
    class Expected{
        public:
            [[nodiscard]] static Expected success(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>){
                Expected e;
                e.construct_(v);
                return e;
            }

            [[nodiscard]] static Expected success(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>){
                Expected e;
                e.construct_(std::move(v));
                return e;
            }

            // // builds T in place from ctor args
            template <class... Args>
            [[nodiscard]] static Expected emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>){
                Expected e;
                e.construct_(std::forward<Args>(args)...);
                return e;
            }

            [[nodiscard]] static Expected failure(Status s) noexcept{
                Expected e;
                e.err_ = (s == Status::kOK) ? Status::kPreconditionFail : s;   // failure(kOK) is a caller bug
                return e;
            }

            Expected(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>) : err_(o.err_){
                if (o.ok_) construct_(*o.ptr_());
            }

            Expected(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : err_(o.err_){
                if (o.ok_) construct_(std::move(*o.ptr_()));
                o.destroy_();
            }

            Expected& operator=(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>){
                if (this == &o) return *this;
                destroy_();
                err_ = o.err_;
                if (o.ok_) construct_(*o.ptr_());
                return *this;
            }

            Expected& operator=(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>){
                if (this == &o) return *this;
                destroy_();
                err_ = o.err_;
                if (o.ok_) construct_(std::move(*o.ptr_()));
                o.destroy_();
                return *this;
            }

            ~Expected() noexcept{
                destroy_();
            }

            [[nodiscard]] bool has_value() const noexcept{
                return ok_;
            }

            [[nodiscard]] explicit operator bool() const noexcept{
                return ok_;
            }

            [[nodiscard]] Status status() const noexcept{
                return ok_ ? Status::kOK : err_;
            }

            // // caller must check has_value() first
            [[nodiscard]] T& value() noexcept{
                return *ptr_();
            }

            [[nodiscard]] const T& value() const noexcept{
                return *ptr_();
            }

            [[nodiscard]] T value_or(T fallback) const noexcept(std::is_nothrow_copy_constructible_v<T>){
                return ok_ ? *ptr_() : fallback;
            }

            // // moves the value out and leaves the carrier empty
            [[nodiscard]] T take() noexcept(std::is_nothrow_move_constructible_v<T>){
                T out = std::move(*ptr_());
                destroy_();
                err_ = Status::kPreconditionFail;
                return out;
            }

        private:
            Expected() = default;

            template <class... Args>
            void construct_(Args&&... args){
                ::new (static_cast<void*>(storage_)) T(std::forward<Args>(args)...);
                ok_ = true;
                err_ = Status::kOK;
            }

            void destroy_() noexcept{
                if (!ok_) return;
                ptr_()->~T();
                ok_ = false;
            }

            T* ptr_() noexcept{
                return std::launder(reinterpret_cast<T*>(storage_));
            }

            const T* ptr_() const noexcept{
                return std::launder(reinterpret_cast<const T*>(storage_));
            }

            alignas(T) unsigned char storage_[sizeof(T)]{};
            Status err_{Status::kOK};
            bool ok_{false};
    };

} // namespace mrac
