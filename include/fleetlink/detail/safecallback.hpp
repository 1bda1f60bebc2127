// MIT License
//
// Copyright (c) 2023 Egor Tsvetkov
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef _FLEETLINK_DETAIL_SAFECALLBACK_HPP_
#define _FLEETLINK_DETAIL_SAFECALLBACK_HPP_

#include <functional>
#include <memory>

namespace fleetlink::detail {

/**
 * \brief Lifetime flag of an object owning pending async operations
 * \details The flag is shared with every GuardedMemberCallback created for the object
 * and is cleared by the destructor. A completion handler that fires after the owner is
 * gone (for example, the cancelled receive of a destroyed Receiver) sees the cleared
 * flag and does nothing.
 */
class LifetimeTracker
{
public:
    LifetimeTracker() : alive_(std::make_shared<bool>(true)) {}
    ~LifetimeTracker() { *alive_ = false; }

    LifetimeTracker(const LifetimeTracker&) = delete;
    LifetimeTracker& operator=(const LifetimeTracker&) = delete;

    [[nodiscard]] std::shared_ptr<const bool> aliveFlag() const { return alive_; }
private:
    std::shared_ptr<bool> alive_;
};

template<typename Function> class GuardedMemberCallback;

/*!
 * @brief Member function bound to an object derived from LifetimeTracker
 *
 * @details Calls the member function only while the object is alive, otherwise
 * returns a default constructed value. It is copyable, so it can be stored in a
 * std::function and passed wherever a plain callback is expected.
 *
 * @tparam ClassType class derived from LifetimeTracker
 * @tparam ReturnType return type of the member function
 * @tparam ...Args  arguments of the member function
 */
template<typename ClassType, typename ReturnType, typename ... Args>
class GuardedMemberCallback<ReturnType(ClassType::*)(Args...)>
{
public:
    using FunctionType = ReturnType(Args...);
    using MemberFunctionType = ReturnType(ClassType::*)(Args...);

    GuardedMemberCallback(MemberFunctionType func, ClassType* obj) :
        func_(func), obj_(obj), alive_(obj->aliveFlag()) {}

    ReturnType operator()(Args... args) const
    {
        if(*alive_) {
            return (obj_->*func_)(std::forward<Args>(args)...);
        }
        return ReturnType();
    }
private:
    MemberFunctionType func_;
    ClassType* obj_;
    std::shared_ptr<const bool> alive_;
};

} /* namespace fleetlink::detail */

#endif // _FLEETLINK_DETAIL_SAFECALLBACK_HPP_
