#include "keycode_table.h"

#include <cctype>
#include <unordered_map>

namespace keycode_table {

namespace {

struct Table {
    std::vector<KeyMapEntry> entries;
    std::unordered_map<char32_t, size_t> index;

    void add(char32_t cp, uint8_t mods, uint8_t usage) {
        KeyMapEntry e{cp, 1, {{mods, usage}, {MOD_NONE, KEY_NONE}}};
        push(e);
    }

    void add_dead(char32_t cp, KeyStroke dead, KeyStroke base) {
        KeyMapEntry e{cp, 2, {dead, base}};
        push(e);
    }

    void push(const KeyMapEntry& e) {
        // First definition wins; later duplicates are a table bug and ignored.
        if (index.count(e.code_point)) return;
        index.emplace(e.code_point, entries.size());
        entries.push_back(e);
    }
};

uint8_t letter_usage(char c) {
    return static_cast<uint8_t>(KEY_A + (std::tolower(static_cast<unsigned char>(c)) - 'a'));
}

uint8_t digit_usage(char c) {
    return c == '0' ? KEY_0 : static_cast<uint8_t>(KEY_1 + (c - '1'));
}

// Letters, digits, space and tab sit on the same keys in both layouts.
void add_common(Table& t) {
    for (char c = 'a'; c <= 'z'; ++c) {
        t.add(static_cast<char32_t>(c), MOD_NONE, letter_usage(c));
        t.add(static_cast<char32_t>(c - 'a' + 'A'), MOD_LEFT_SHIFT, letter_usage(c));
    }
    for (char c = '0'; c <= '9'; ++c) {
        t.add(static_cast<char32_t>(c), MOD_NONE, digit_usage(c));
    }
    t.add(U' ', MOD_NONE, KEY_SPACE);
    t.add(U'\t', MOD_NONE, KEY_TAB);
}

// ─── US ─────────────────────────────────────────────────────────────────────

Table build_us() {
    Table t;
    add_common(t);

    const char* shifted_digits = ")!@#$%^&*(";  // indexed by digit value
    for (int d = 0; d <= 9; ++d) {
        t.add(static_cast<char32_t>(shifted_digits[d]), MOD_LEFT_SHIFT,
              digit_usage(static_cast<char>('0' + d)));
    }

    struct Pair { uint8_t usage; char plain; char shifted; };
    static const Pair punct[] = {
        { 0x2D, '-',  '_' },
        { 0x2E, '=',  '+' },
        { 0x2F, '[',  '{' },
        { 0x30, ']',  '}' },
        { 0x31, '\\', '|' },
        { 0x33, ';',  ':' },
        { 0x34, '\'', '"' },
        { 0x35, '`',  '~' },
        { 0x36, ',',  '<' },
        { 0x37, '.',  '>' },
        { 0x38, '/',  '?' },
    };
    for (const Pair& p : punct) {
        t.add(static_cast<char32_t>(p.plain), MOD_NONE, p.usage);
        t.add(static_cast<char32_t>(p.shifted), MOD_LEFT_SHIFT, p.usage);
    }
    return t;
}

// ─── Danish ─────────────────────────────────────────────────────────────────

constexpr uint8_t DA_KEY_PLUS    = 0x2D;  // + ? (AltGr none)
constexpr uint8_t DA_KEY_ACUTE   = 0x2E;  // dead ´, dead `, AltGr |
constexpr uint8_t DA_KEY_ARING   = 0x2F;  // å Å
constexpr uint8_t DA_KEY_UMLAUT  = 0x30;  // dead ¨, dead ^, AltGr dead ~
constexpr uint8_t DA_KEY_APOS    = 0x32;  // ' *
constexpr uint8_t DA_KEY_AE      = 0x33;  // æ Æ
constexpr uint8_t DA_KEY_OSLASH  = 0x34;  // ø Ø
constexpr uint8_t DA_KEY_HALF    = 0x35;  // ½ §
constexpr uint8_t DA_KEY_COMMA   = 0x36;  // , ;
constexpr uint8_t DA_KEY_PERIOD  = 0x37;  // . :
constexpr uint8_t DA_KEY_MINUS   = 0x38;  // - _

constexpr KeyStroke DEAD_ACUTE      = { MOD_NONE,       DA_KEY_ACUTE  };
constexpr KeyStroke DEAD_GRAVE      = { MOD_LEFT_SHIFT, DA_KEY_ACUTE  };
constexpr KeyStroke DEAD_DIAERESIS  = { MOD_NONE,       DA_KEY_UMLAUT };
constexpr KeyStroke DEAD_CIRCUMFLEX = { MOD_LEFT_SHIFT, DA_KEY_UMLAUT };
constexpr KeyStroke DEAD_TILDE      = { MOD_RIGHT_ALT,  DA_KEY_UMLAUT };

// Composed letters: lower-case code point, upper-case code point (0 = none).
struct Composed { char base; char32_t lower; char32_t upper; };

void add_composed(Table& t, KeyStroke dead, const Composed* list, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        const Composed& c = list[i];
        uint8_t usage = letter_usage(c.base);
        t.add_dead(c.lower, dead, { MOD_NONE, usage });
        if (c.upper) {
            t.add_dead(c.upper, dead, { MOD_LEFT_SHIFT, usage });
        }
    }
}

Table build_danish() {
    Table t;
    add_common(t);

    // Shifted digit row: ! " # ¤ % & / ( ) =
    static const char32_t shifted[] = {
        U'=', U'!', U'"', U'#', U'¤', U'%', U'&', U'/', U'(', U')'
    };
    for (int d = 0; d <= 9; ++d) {
        t.add(shifted[d], MOD_LEFT_SHIFT, digit_usage(static_cast<char>('0' + d)));
    }

    // AltGr digit row
    t.add(U'@',  MOD_RIGHT_ALT, digit_usage('2'));
    t.add(U'£',  MOD_RIGHT_ALT, digit_usage('3'));
    t.add(U'$',  MOD_RIGHT_ALT, digit_usage('4'));
    t.add(U'€',  MOD_RIGHT_ALT, digit_usage('5'));
    t.add(U'{',  MOD_RIGHT_ALT, digit_usage('7'));
    t.add(U'[',  MOD_RIGHT_ALT, digit_usage('8'));
    t.add(U']',  MOD_RIGHT_ALT, digit_usage('9'));
    t.add(U'}',  MOD_RIGHT_ALT, digit_usage('0'));

    t.add(U'+',  MOD_NONE,       DA_KEY_PLUS);
    t.add(U'?',  MOD_LEFT_SHIFT, DA_KEY_PLUS);
    t.add(U'|',  MOD_RIGHT_ALT,  DA_KEY_ACUTE);
    t.add(U'å',  MOD_NONE,       DA_KEY_ARING);
    t.add(U'Å',  MOD_LEFT_SHIFT, DA_KEY_ARING);
    t.add(U'\'', MOD_NONE,       DA_KEY_APOS);
    t.add(U'*',  MOD_LEFT_SHIFT, DA_KEY_APOS);
    t.add(U'æ',  MOD_NONE,       DA_KEY_AE);
    t.add(U'Æ',  MOD_LEFT_SHIFT, DA_KEY_AE);
    t.add(U'ø',  MOD_NONE,       DA_KEY_OSLASH);
    t.add(U'Ø',  MOD_LEFT_SHIFT, DA_KEY_OSLASH);
    t.add(U'½',  MOD_NONE,       DA_KEY_HALF);
    t.add(U'§',  MOD_LEFT_SHIFT, DA_KEY_HALF);
    t.add(U',',  MOD_NONE,       DA_KEY_COMMA);
    t.add(U';',  MOD_LEFT_SHIFT, DA_KEY_COMMA);
    t.add(U'.',  MOD_NONE,       DA_KEY_PERIOD);
    t.add(U':',  MOD_LEFT_SHIFT, DA_KEY_PERIOD);
    t.add(U'-',  MOD_NONE,       DA_KEY_MINUS);
    t.add(U'_',  MOD_LEFT_SHIFT, DA_KEY_MINUS);
    t.add(U'<',  MOD_NONE,       KEY_NON_US_BSL);
    t.add(U'>',  MOD_LEFT_SHIFT, KEY_NON_US_BSL);
    t.add(U'\\', MOD_RIGHT_ALT,  KEY_NON_US_BSL);
    t.add(U'µ',  MOD_RIGHT_ALT,  letter_usage('m'));

    // Dead keys typed on their own: dead key followed by space.
    const KeyStroke space = { MOD_NONE, KEY_SPACE };
    t.add_dead(U'´',  DEAD_ACUTE,      space);
    t.add_dead(U'`',  DEAD_GRAVE,      space);
    t.add_dead(U'¨',  DEAD_DIAERESIS,  space);
    t.add_dead(U'^',  DEAD_CIRCUMFLEX, space);
    t.add_dead(U'~',  DEAD_TILDE,      space);

    static const Composed acute[] = {
        { 'a', U'á', U'Á' }, { 'e', U'é', U'É' },
        { 'i', U'í', U'Í' }, { 'o', U'ó', U'Ó' },
        { 'u', U'ú', U'Ú' }, { 'y', U'ý', U'Ý' },
    };
    static const Composed grave[] = {
        { 'a', U'à', U'À' }, { 'e', U'è', U'È' },
        { 'i', U'ì', U'Ì' }, { 'o', U'ò', U'Ò' },
        { 'u', U'ù', U'Ù' },
    };
    static const Composed diaeresis[] = {
        { 'a', U'ä', U'Ä' }, { 'e', U'ë', U'Ë' },
        { 'i', U'ï', U'Ï' }, { 'o', U'ö', U'Ö' },
        { 'u', U'ü', U'Ü' }, { 'y', U'ÿ', 0 },
    };
    static const Composed circumflex[] = {
        { 'a', U'â', U'Â' }, { 'e', U'ê', U'Ê' },
        { 'i', U'î', U'Î' }, { 'o', U'ô', U'Ô' },
        { 'u', U'û', U'Û' },
    };
    static const Composed tilde[] = {
        { 'a', U'ã', U'Ã' }, { 'o', U'õ', U'Õ' },
        { 'n', U'ñ', U'Ñ' },
    };
    add_composed(t, DEAD_ACUTE,      acute,      sizeof(acute) / sizeof(acute[0]));
    add_composed(t, DEAD_GRAVE,      grave,      sizeof(grave) / sizeof(grave[0]));
    add_composed(t, DEAD_DIAERESIS,  diaeresis,  sizeof(diaeresis) / sizeof(diaeresis[0]));
    add_composed(t, DEAD_CIRCUMFLEX, circumflex, sizeof(circumflex) / sizeof(circumflex[0]));
    add_composed(t, DEAD_TILDE,      tilde,      sizeof(tilde) / sizeof(tilde[0]));
    return t;
}

const Table& table(Layout layout) {
    static const Table us = build_us();
    static const Table da = build_danish();
    return layout == Layout::US ? us : da;
}

} // namespace

bool parse_layout(const std::string& name, Layout& out) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "us" || lower == "en-us") {
        out = Layout::US;
        return true;
    }
    if (lower == "da" || lower == "dk" || lower == "danish") {
        out = Layout::DANISH;
        return true;
    }
    return false;
}

const char* layout_name(Layout layout) {
    return layout == Layout::US ? "us" : "da";
}

const KeyMapEntry* lookup(Layout layout, char32_t code_point) {
    const Table& t = table(layout);
    auto it = t.index.find(code_point);
    if (it == t.index.end()) return nullptr;
    return &t.entries[it->second];
}

const std::vector<KeyMapEntry>& entries(Layout layout) {
    return table(layout).entries;
}

} // namespace keycode_table
