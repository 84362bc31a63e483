#include <cctype>
#include <unordered_map>
#include <utility>
#include <vector>

extern "C" {
    #include <linux/input.h>
}

#include "KeyNames.hpp"

using namespace std;

namespace {
    struct KeyEntry {
        const char *name;
        KeyCode code;
    };

    /** The first entry for a code is its canonical name. */
    const vector<KeyEntry> KEY_TABLE = {
        {"Escape", KEY_ESC}, {"Esc", KEY_ESC},
        {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4}, {"5", KEY_5},
        {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9}, {"0", KEY_0},
        {"Minus", KEY_MINUS}, {"Equal", KEY_EQUAL},
        {"Backspace", KEY_BACKSPACE}, {"Tab", KEY_TAB},
        {"Q", KEY_Q}, {"W", KEY_W}, {"E", KEY_E}, {"R", KEY_R}, {"T", KEY_T},
        {"Y", KEY_Y}, {"U", KEY_U}, {"I", KEY_I}, {"O", KEY_O}, {"P", KEY_P},
        {"LeftBrace", KEY_LEFTBRACE}, {"RightBrace", KEY_RIGHTBRACE},
        {"Enter", KEY_ENTER}, {"Return", KEY_ENTER},
        {"LeftCtrl", KEY_LEFTCTRL}, {"LeftControl", KEY_LEFTCTRL}, {"Ctrl", KEY_LEFTCTRL},
        {"Control", KEY_LEFTCTRL},
        {"A", KEY_A}, {"S", KEY_S}, {"D", KEY_D}, {"F", KEY_F}, {"G", KEY_G},
        {"H", KEY_H}, {"J", KEY_J}, {"K", KEY_K}, {"L", KEY_L},
        {"Semicolon", KEY_SEMICOLON}, {"Apostrophe", KEY_APOSTROPHE}, {"Grave", KEY_GRAVE},
        {"LeftShift", KEY_LEFTSHIFT}, {"Shift", KEY_LEFTSHIFT},
        {"Backslash", KEY_BACKSLASH},
        {"Z", KEY_Z}, {"X", KEY_X}, {"C", KEY_C}, {"V", KEY_V}, {"B", KEY_B},
        {"N", KEY_N}, {"M", KEY_M},
        {"Comma", KEY_COMMA}, {"Dot", KEY_DOT}, {"Slash", KEY_SLASH},
        {"RightShift", KEY_RIGHTSHIFT},
        {"KpAsterisk", KEY_KPASTERISK},
        {"LeftAlt", KEY_LEFTALT}, {"Alt", KEY_LEFTALT},
        {"Space", KEY_SPACE},
        {"CapsLock", KEY_CAPSLOCK},
        {"F1", KEY_F1}, {"F2", KEY_F2}, {"F3", KEY_F3}, {"F4", KEY_F4},
        {"F5", KEY_F5}, {"F6", KEY_F6}, {"F7", KEY_F7}, {"F8", KEY_F8},
        {"F9", KEY_F9}, {"F10", KEY_F10}, {"F11", KEY_F11}, {"F12", KEY_F12},
        {"NumLock", KEY_NUMLOCK}, {"ScrollLock", KEY_SCROLLLOCK},
        {"KpEnter", KEY_KPENTER},
        {"RightCtrl", KEY_RIGHTCTRL}, {"RightControl", KEY_RIGHTCTRL},
        {"SysRq", KEY_SYSRQ}, {"PrintScreen", KEY_SYSRQ},
        {"RightAlt", KEY_RIGHTALT}, {"AltGr", KEY_RIGHTALT},
        {"Home", KEY_HOME}, {"Up", KEY_UP}, {"PageUp", KEY_PAGEUP},
        {"Left", KEY_LEFT}, {"Right", KEY_RIGHT}, {"End", KEY_END},
        {"Down", KEY_DOWN}, {"PageDown", KEY_PAGEDOWN},
        {"Insert", KEY_INSERT}, {"Delete", KEY_DELETE},
        {"Mute", KEY_MUTE}, {"VolumeDown", KEY_VOLUMEDOWN}, {"VolumeUp", KEY_VOLUMEUP},
        {"Pause", KEY_PAUSE},
        {"LeftMeta", KEY_LEFTMETA}, {"Super", KEY_LEFTMETA}, {"Meta", KEY_LEFTMETA},
        {"RightMeta", KEY_RIGHTMETA},
        {"Compose", KEY_COMPOSE}, {"Menu", KEY_COMPOSE},
        {"NextSong", KEY_NEXTSONG}, {"PlayPause", KEY_PLAYPAUSE},
        {"PreviousSong", KEY_PREVIOUSSONG}, {"StopCd", KEY_STOPCD},
        {"F13", KEY_F13}, {"F14", KEY_F14}, {"F15", KEY_F15}, {"F16", KEY_F16},
        {"F17", KEY_F17}, {"F18", KEY_F18}, {"F19", KEY_F19}, {"F20", KEY_F20},
        {"F21", KEY_F21}, {"F22", KEY_F22}, {"F23", KEY_F23}, {"F24", KEY_F24},
    };

    /** "KEY_Left_Ctrl" -> "leftctrl" */
    string normalize(const string& name) {
        string out;
        size_t start = 0;
        if (name.size() > 4 && toupper(name[0]) == 'K' && toupper(name[1]) == 'E' &&
            toupper(name[2]) == 'Y' && name[3] == '_')
            start = 4;
        for (size_t i = start; i < name.size(); i++) {
            unsigned char c = static_cast<unsigned char>(name[i]);
            if (c == '_' || isspace(c))
                continue;
            out.push_back(static_cast<char>(tolower(c)));
        }
        return out;
    }

    const unordered_map<string, KeyCode>& byName() {
        static const unordered_map<string, KeyCode> table = []() {
            unordered_map<string, KeyCode> m;
            for (const auto& entry : KEY_TABLE)
                m.emplace(normalize(entry.name), entry.code);
            return m;
        }();
        return table;
    }

    const unordered_map<KeyCode, string>& byCode() {
        static const unordered_map<KeyCode, string> table = []() {
            unordered_map<KeyCode, string> m;
            for (const auto& entry : KEY_TABLE)
                m.emplace(entry.code, entry.name);
            return m;
        }();
        return table;
    }
}

optional<KeyCode> keyFromName(const string& name) {
    const auto& table = byName();
    auto it = table.find(normalize(name));
    if (it == table.end())
        return nullopt;
    return it->second;
}

string keyName(KeyCode code) {
    const auto& table = byCode();
    auto it = table.find(code);
    if (it == table.end())
        return "KEY_" + to_string(code);
    return it->second;
}

bool isModifier(KeyCode code) noexcept {
    switch (code) {
        case KEY_LEFTCTRL: case KEY_RIGHTCTRL:
        case KEY_LEFTSHIFT: case KEY_RIGHTSHIFT:
        case KEY_LEFTALT: case KEY_RIGHTALT:
        case KEY_LEFTMETA: case KEY_RIGHTMETA:
            return true;
        default:
            return false;
    }
}
