#pragma once

#include <string>
#include <vector>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Split libssh2's comma-separated method list ("publickey,password").
std::vector<std::string> parse_auth_methods(const char* list);

bool offers_method(const std::vector<std::string>& methods, const std::string& method);

// Keyboard-interactive state handed to libssh2 through the session's
// abstract pointer. Every prompt is answered with `password`.
struct KbdAuthData {
    const std::string* password = nullptr;
    int prompt_round = 0;
    int prompts_answered = 0;
};

// Install `data` as the session's abstract pointer for the duration of one
// keyboard-interactive exchange; restores the previous pointer on scope exit.
class KbdAuthScope {
public:
    KbdAuthScope(LIBSSH2_SESSION* session, KbdAuthData* data);
    ~KbdAuthScope();

    KbdAuthScope(const KbdAuthScope&) = delete;
    KbdAuthScope& operator=(const KbdAuthScope&) = delete;

private:
    LIBSSH2_SESSION* session_;
    void* previous_;
};

// Signature matches LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC.
void seacmd_kbd_callback(const char* name, int name_len,
                          const char* instruction, int instruction_len,
                          int num_prompts,
                          const struct _LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          struct _LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract);
