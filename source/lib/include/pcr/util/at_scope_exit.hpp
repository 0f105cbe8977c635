#pragma once

#include <utility>

// Runs fun when leaving the scope unless released before
template<class FunT>
struct AtScopeExit
{
    AtScopeExit() = delete;
    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit(AtScopeExit&&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;
    AtScopeExit& operator=(AtScopeExit&&) = delete;

    AtScopeExit(FunT fun)
        : m_Dtor{ std::move(fun) }
    {}

    ~AtScopeExit()
    {
        if (m_Armed)
        {
            m_Dtor();
        }
    }

    void Release()
    {
        m_Armed = false;
    }

    FunT m_Dtor;
    bool m_Armed{ true };
};
