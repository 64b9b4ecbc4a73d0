// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-CLE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael

#include "runtime/ActionTypes.h"

namespace CLE {

std::string toString(FailureCause cause) {
    switch (cause) {
    case FailureCause::None:
        return "none";
    case FailureCause::Reported:
        return "reported";
    case FailureCause::Timeout:
        return "timeout";
    case FailureCause::Exception:
        return "exception";
    case FailureCause::NoHandler:
        return "no_handler";
    }
    return "unknown";
}

}  // namespace CLE
