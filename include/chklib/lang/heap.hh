#pragma once

#include <chklib/lang/value.hh>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace chk::lang {

/**
 * @brief Owner of all objects created by one execution
 * @details Objects are reference counted and freed once unreachable from
 *   references; reference cycles are broken when the heap is destroyed, so
 *   every ObjRef to the heap's objects has to be gone by then. Every object
 *   and every runtime string is charged against the byte budget, exceeding
 *   it raises MemoryError.
 */
class Heap {
    struct Budget {
        size_t used = 0;
        size_t limit;
    };

    std::shared_ptr<Budget> budget_; // shared with the deleters of strings
    Object* first_ = nullptr; // list of live objects
    size_t objects_num_ = 0;
    std::vector<Object*> pending_release_;
    bool releasing_ = false;

    void link(Object* obj) noexcept;
    void unlink(Object* obj) noexcept;

    void charge(size_t bytes);
    void refund(size_t bytes) noexcept;

public:
    explicit Heap(size_t limit_in_bytes);

    Heap(const Heap&) = delete;
    Heap(Heap&&) = delete;
    Heap& operator=(const Heap&) = delete;
    Heap& operator=(Heap&&) = delete;

    ~Heap();

    template <class T, class... Args>
    ObjRef make(Args&&... args) {
        static_assert(std::is_base_of_v<Object, T>);
        charge(sizeof(T));
        std::unique_ptr<T> obj;
        try {
            obj = std::make_unique<T>(std::forward<Args>(args)...);
        } catch (...) {
            refund(sizeof(T));
            throw;
        }
        obj->charged_bytes_ = sizeof(T);
        link(obj.get());
        return ObjRef{obj.release()};
    }

    // Charges @p obj with @p bytes in total (the object itself included)
    void recharge(Object& obj, size_t bytes);

    // Creates a runtime string, its bytes are refunded when the last reference is gone
    StrPtr make_str(std::string str);

    [[nodiscard]] size_t used_bytes() const noexcept { return budget_->used; }

    [[nodiscard]] size_t objects_num() const noexcept { return objects_num_; }

    // Called by ObjRef when the last reference to @p obj is dropped
    void release(Object* obj) noexcept;
};

} // namespace chk::lang
