#include <chklib/lang/exceptions.hh>
#include <chklib/lang/heap.hh>
#include <chklib/limits.hh>

namespace chk::lang {

ObjRef::ObjRef(Object* obj) noexcept : obj_{obj} {
    if (obj_) {
        ++obj_->refcount_;
    }
}

void ObjRef::reset() noexcept {
    Object* obj = std::exchange(obj_, nullptr);
    if (obj and --obj->refcount_ == 0) {
        obj->heap_->release(obj);
    }
}

void move_refs(Value& val, std::vector<ObjRef>& out) noexcept {
    if (auto* ref = std::get_if<ObjRef>(&val)) {
        out.emplace_back(std::move(*ref));
    }
    val = NoneType{};
}

void move_refs(std::vector<Value>& values, std::vector<ObjRef>& out) noexcept {
    for (auto& val : values) {
        move_refs(val, out);
    }
    values.clear();
}

Heap::Heap(size_t limit_in_bytes) : budget_{std::make_shared<Budget>(Budget{.limit = limit_in_bytes})} {
    pending_release_.reserve(64);
}

Heap::~Heap() {
    // Pinning every object makes breaking the cycles free nothing prematurely
    for (Object* obj = first_; obj; obj = obj->next_) {
        ++obj->refcount_;
    }
    std::vector<ObjRef> dropped;
    for (Object* obj = first_; obj; obj = obj->next_) {
        obj->clear_refs(dropped);
        dropped.clear();
    }
    while (first_) {
        Object* obj = first_;
        unlink(obj);
        refund(obj->charged_bytes_);
        delete obj;
    }
}

void Heap::link(Object* obj) noexcept {
    obj->heap_ = this;
    obj->prev_ = nullptr;
    obj->next_ = first_;
    if (first_) {
        first_->prev_ = obj;
    }
    first_ = obj;
    ++objects_num_;
}

void Heap::unlink(Object* obj) noexcept {
    if (obj->prev_) {
        obj->prev_->next_ = obj->next_;
    } else {
        first_ = obj->next_;
    }
    if (obj->next_) {
        obj->next_->prev_ = obj->prev_;
    }
    --objects_num_;
}

void Heap::charge(size_t bytes) {
    Budget& budget = *budget_;
    if (bytes > budget.limit - budget.used) {
        raise(ExceptionKind::MEMORY_ERROR, "memory limit exceeded");
    }
    budget.used += bytes;
}

void Heap::refund(size_t bytes) noexcept { budget_->used -= bytes; }

void Heap::recharge(Object& obj, size_t bytes) {
    if (bytes > obj.charged_bytes_) {
        charge(bytes - obj.charged_bytes_);
    } else {
        refund(obj.charged_bytes_ - bytes);
    }
    obj.charged_bytes_ = bytes;
}

StrPtr Heap::make_str(std::string str) {
    if (str.size() > limits::max_string_length) {
        raise(ExceptionKind::MEMORY_ERROR, "string is too long");
    }
    size_t bytes = sizeof(std::string) + str.size();
    auto owned = std::make_unique<std::string>(std::move(str));
    charge(bytes);
    // If the control block allocation fails, the deleter is still called
    return StrPtr{owned.release(), [budget = budget_, bytes](const std::string* s) {
                      budget->used -= bytes;
                      delete s;
                  }};
}

void Heap::release(Object* obj) noexcept {
    pending_release_.emplace_back(obj);
    if (releasing_) {
        return;
    }
    // Objects freed by this release are queued instead of being freed recursively
    releasing_ = true;
    std::vector<ObjRef> dropped;
    while (not pending_release_.empty()) {
        Object* cur = pending_release_.back();
        pending_release_.pop_back();
        cur->clear_refs(dropped);
        dropped.clear();
        unlink(cur);
        refund(cur->charged_bytes_);
        delete cur;
    }
    releasing_ = false;
}

int64_t RangeObject::length() const noexcept {
    // Computed in uint64_t, the distance may not fit in int64_t
    auto ustart = static_cast<uint64_t>(start);
    auto ustop = static_cast<uint64_t>(stop);
    auto ustep = static_cast<uint64_t>(step);
    if (step > 0 and start < stop) {
        return static_cast<int64_t>((ustop - ustart - 1) / ustep + 1);
    }
    if (step < 0 and start > stop) {
        return static_cast<int64_t>((ustart - ustop - 1) / (0 - ustep) + 1);
    }
    return 0;
}

} // namespace chk::lang
