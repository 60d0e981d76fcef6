#pragma once
/* This file is part of Shipyard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <functional>

namespace shipyard {
    struct scope_exit {
        explicit scope_exit(std::function<void()> &&action):
            _action { std::move(action) }
        {
        }

        scope_exit(const scope_exit &) =delete;
        scope_exit &operator=(const scope_exit &) =delete;

        ~scope_exit()
        {
            if (_action)
                _action();
        }

        void release() noexcept
        {
            _action = nullptr;
        }
    private:
        std::function<void()> _action;
    };
}
