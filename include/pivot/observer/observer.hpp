#pragma once
/**
 * @file observer.hpp
 * @brief Listener interface invoked by SubjectRegistry on every broadcast.
 */

namespace pivot::observer {

    template <class T>
    class Observer {
    public:
        virtual ~Observer() = default;

        /**
         * @brief Receive the subject's value. Called synchronously on the broadcasting thread.
         * @param value Value being broadcast (new on set_value, current on notify).
         */
        virtual void on_value_changed(const T& value) = 0;
    };

} // namespace pivot::observer
