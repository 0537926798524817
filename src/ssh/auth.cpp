#include "auth.hpp"
#include <libssh2.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>

std::vector<std::string> parse_auth_methods(const char* list) {
    std::vector<std::string> methods;
    if (!list) return methods;

    std::string all(list);
    size_t pos = 0;
    while (pos <= all.size()) {
        auto comma = all.find(',', pos);
        if (comma == std::string::npos) comma = all.size();
        if (comma > pos) methods.push_back(all.substr(pos, comma - pos));
        pos = comma + 1;
    }
    return methods;
}

bool offers_method(const std::vector<std::string>& methods, const std::string& method) {
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

KbdAuthScope::KbdAuthScope(LIBSSH2_SESSION* session, KbdAuthData* data)
    : session_(session), previous_(*libssh2_session_abstract(session)) {
    *libssh2_session_abstract(session_) = data;
}

KbdAuthScope::~KbdAuthScope() {
    *libssh2_session_abstract(session_) = previous_;
}

// libssh2 frees each response text with its own allocator (free() by
// default), so answers are strdup'd.
void seacmd_kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    if (!data || !data->password) return;

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password->c_str());
        responses[i].length = static_cast<unsigned int>(data->password->length());
        data->prompts_answered++;
    }
    data->prompt_round++;
}
