#include "honeybee/utils/pj_thread.hpp"

#include <pj/errno.h>
#include <pj/os.h>

#include "honeybee/logging.hpp"

namespace honeybee::utils {

bool ensure_pj_thread_registered(const char* name) {
    if (pj_thread_is_registered()) {
        return true;
    }
    thread_local pj_thread_desc desc;
    pj_thread_t* thread = nullptr;
    const char* thread_name = name ? name : "honeybee";
    const pj_status_t status = pj_thread_register(thread_name, desc, &thread);
    if (status != PJ_SUCCESS) {
        char reason[PJ_ERR_MSG_SIZE] = {};
        pj_strerror(status, reason, sizeof(reason));
        logging::warn("pjlib thread registration failed",
                      {kv("thread", thread_name), kv("status", status), kv("reason", reason)});
        return false;
    }
    return true;
}

}
