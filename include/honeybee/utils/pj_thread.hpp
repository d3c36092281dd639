#pragma once

namespace honeybee {
namespace utils {

// pjlib refuses calls from threads it has not seen; register on first use.
// False when pjlib rejected the registration.
bool ensure_pj_thread_registered(const char* name);

}
}
