#ifndef VITCO_CORE_IQUITVETO_HPP
#define VITCO_CORE_IQUITVETO_HPP

/**
 * @file IQuitVeto.hpp
 * @brief Lets a component hold process exit while it finishes a flow.
 *
 * Every `hold()` must be matched by exactly one `release()`.
 */

#include <string>

namespace vitco {

    class IQuitVeto {
    public:
        virtual ~IQuitVeto() = default;

        virtual void hold(const std::string& reason) = 0;
        virtual void release(const std::string& reason) = 0;
    };

}

#endif  // VITCO_CORE_IQUITVETO_HPP
