#pragma once
#include <cassert>
#include <cstddef>  // std::ptrdiff_t
#include <iterator> // std::forward_iterator_tag
#include <utility>  // std::exchange, std::forward

#ifdef NDEBUG // Same macro that controls assert()
#define DEBUG_ONLY(x)
#else
#define DEBUG_ONLY(x) x
#endif // NDEBUG

// Circular doubly-linked list of owned values. Supports O(1) push to either end,
// O(1) removal of the front and O(1) splicing of another list onto the back.
// Values are never copied: nodes are moved between lists through handles.
template <typename T>
class DList {
    struct Node {
        T val;
        Node* prev DEBUG_ONLY(= nullptr);
        Node* next DEBUG_ONLY(= nullptr);
        template <typename... Args>
        explicit Node(std::in_place_t, Args&&... args) : val(std::forward<Args>(args)...) {}
    };

    Node* head = nullptr;
    int numValues = 0;
public:
    DList() = default;
    // No list copying, only moving
    DList(const DList&) = delete;
    DList& operator=(const DList&) = delete;
    DList(DList&& other) noexcept
        : head{ std::exchange(other.head, nullptr) }, numValues{ std::exchange(other.numValues, 0) } {}
    DList& operator=(DList&& other) noexcept {
        if (this != &other) {
            clear();
            head = std::exchange(other.head, nullptr);
            numValues = std::exchange(other.numValues, 0);
        }
        return *this;
    }
    ~DList() { clear(); }

    // A handle is the owner of a single node that is not part of any list.
    // Obtained from make() or popFront(), owns the memory until it's given to a push.
    class handle {
        friend class DList; // Only the list can create non-empty handles
        Node* ptr = nullptr;
        explicit handle(Node* ptr) noexcept : ptr{ ptr } {}
    public:
        handle() = default;
        handle(handle&& other) noexcept : ptr{ std::exchange(other.ptr, nullptr) } {}
        handle& operator=(handle&& other) noexcept {
            if (this != &other) {
                delete ptr;
                ptr = std::exchange(other.ptr, nullptr);
            }
            return *this;
        }
        // Avoid memory leaks from handles never pushed anywhere
        ~handle() { delete ptr; }
        T& operator*() const noexcept { return ptr->val; }
        T* operator->() const noexcept { return &ptr->val; }
        explicit operator bool() const noexcept { return (ptr != nullptr); }
    };

    // Constructs a new value in a free-standing node
    template <typename... Args>
    static handle make(Args&&... args) {
        return handle{ new Node{ std::in_place, std::forward<Args>(args)... } };
    }

    // Insertion is done at the end of the list (so, immediately before head).
    // Note that this resets the handle, so it doesn't attempt to free the memory on scope exit later.
    void pushBack(handle&& hnd) noexcept {
        Node* ptr = std::exchange(hnd.ptr, nullptr);
        assert(ptr && ptr->prev == nullptr && ptr->next == nullptr);
        if (head == nullptr) {
            head = ptr;
            head->prev = head->next = head;
        } else {
            head->prev->next = ptr;
            ptr->prev = head->prev;
            head->prev = ptr;
            ptr->next = head;
        }
        ++numValues;
    }
    // In a circular list the front is just the back, rotated by one
    void pushFront(handle&& hnd) noexcept {
        Node* ptr = hnd.ptr;
        pushBack(std::move(hnd));
        head = ptr;
    }
    // Detaches the first node, without destroying the value or deallocating the memory.
    handle popFront() noexcept {
        assert(head);
        Node* ptr = head;
        if (ptr->next == ptr) {
            assert(ptr->prev == ptr);
            head = nullptr;
        } else {
            Node* prev = ptr->prev;
            Node* next = ptr->next;
            assert(ptr == prev->next && ptr == next->prev);
            prev->next = next;
            next->prev = prev;
            head = next;
        }
        DEBUG_ONLY(ptr->prev = ptr->next = nullptr); // checked by pushBack()
        --numValues;
        return handle{ ptr };
    }

    // Checks whether the list is empty
    [[nodiscard("Did you mean .clear()?")]]
    bool empty() const noexcept {
        assert((head == nullptr) == (numValues == 0));
        return (head == nullptr);
    }
    // Returns the # of values in the list
    int size() const noexcept { return numValues; }
    // Empty the list, freeing all allocated memory
    void clear() noexcept {
        if (!head) { return; }
        Node* ptr = head;
        do {
            Node* tmp = ptr->next;
            delete ptr;
            ptr = tmp;
        } while (ptr != head);
        head = nullptr;
        numValues = 0;
    }

    // Append another list, leaving it empty afterwards
    void append(DList&& other) noexcept {
        assert(this != &other);
        if (!other.head) {
            return; // Nothing to do
        }
        if (!head) {
            head = other.head;
            numValues = other.numValues;
        } else {
            Node* last = head->prev;
            Node* last2 = other.head->prev;
            last->next = other.head;
            other.head->prev = last;
            last2->next = head;
            head->prev = last2;
            numValues += other.numValues;
        }
        // This is a "destructive" operation for the appended list
        other.head = nullptr;
        other.numValues = 0;
    }
    // Returns the first value in the list. Undefined for empty lists.
    const T& front() const noexcept {
        assert(head);
        return head->val;
    }

    // Looping over a circular list requires remembering whether we've left head yet.
    class const_iterator {
        const Node* ptr = nullptr;
        bool first = false; // true iff ptr is head & the loop hasn't started
        friend class DList;
        const_iterator(const Node* ptr, bool first) : ptr{ ptr }, first{ first } {}
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;
        const_iterator() = default;
        const T& operator*() const noexcept { return ptr->val; }
        const T* operator->() const noexcept { return &ptr->val; }
        const_iterator& operator++() noexcept { ptr = ptr->next; first = false; return *this; }
        const_iterator operator++(int) noexcept { auto copy = *this; ++*this; return copy; }
        bool operator==(const const_iterator&) const noexcept = default;
    };
    const_iterator begin() const noexcept { return { head, !empty() }; }
    const_iterator end() const noexcept { return { head, false }; }
};
