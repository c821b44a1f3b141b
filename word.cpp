#include <sstream>
#include <stdexcept>
#include <boost/functional/hash.hpp>
#include "word.hpp"

const int Word::bits_per_letter;
const int Word::max_letters;
const int Word::shift_positions;
const int Word::max_search_letters;

static const uint64_t letter_mask = 31;
static const uint64_t letter_a = 1;
static const uint64_t letter_z = 26;

Word::Word(const std::string& r) : c(0) {
    if (r.empty()) {
        throw std::runtime_error("Expected a non-empty word");
    }
    if (r.length() > static_cast<size_t>(max_letters)) {
        throw std::runtime_error("Expected at most " + std::to_string(max_letters) + " letters, not: " + r);
    }
    for (size_t i = 0; i < r.length(); i++) {
        char ch = r[i];
        if (ch < 'a' || ch > 'z') {
            throw std::runtime_error("Expected lowercase letters a-z only, not: " + r);
        }
        c |= static_cast<uint64_t>(ch - 'a' + 1) << (i * bits_per_letter);
    }
}

Word Word::of_code(uint64_t code) {
    if (code == 0) {
        throw std::logic_error("Word::of_code: packed word is zero");
    }
    return Word(code);
}

std::string Word::to_string() const {
    std::string rv;
    rv.reserve(max_letters);
    for (uint64_t w = c; w != 0; w >>= bits_per_letter) {
        rv.push_back(static_cast<char>('a' + (w & letter_mask) - 1));
    }
    return rv;
}

int Word::length() const {
    int bits = 64 - __builtin_clzll(c);
    return (bits + bits_per_letter - 1) / bits_per_letter;
}

boost::optional<Word> Word::dupl_first(int max_length) const {
    int len = length();
    if (len >= max_length || len >= max_letters) return boost::none;
    uint64_t first = c & letter_mask;
    return of_code((c << bits_per_letter) | first);
}

boost::optional<Word> Word::pop() const {
    uint64_t w = c >> bits_per_letter;
    if (w == 0) return boost::none;
    return of_code(w);
}

std::array<boost::optional<Word>, 2> Word::rotate() const {
    std::array<boost::optional<Word>, 2> rv;
    int len = length();
    if (len == 1) return rv;

    int last = (len - 1) * bits_per_letter;
    uint64_t fields = (static_cast<uint64_t>(1) << (len * bits_per_letter)) - 1;
    uint64_t start = c & letter_mask;
    uint64_t end = c >> last;

    rv[0] = of_code((c >> bits_per_letter) | (start << last));
    rv[1] = of_code(((c << bits_per_letter) & fields) | end);
    return rv;
}

std::array<boost::optional<Word>, 12> Word::shifts() const {
    std::array<boost::optional<Word>, 12> rv;
    for (int i = 0; i < shift_positions; i++) {
        int shift = i * bits_per_letter;
        uint64_t mask = letter_mask << shift;
        uint64_t letter = (c & mask) >> shift;
        if (letter == 0) break;

        uint64_t rest = c & ~mask;
        uint64_t up = (letter == letter_z) ? letter_a : letter + 1;
        uint64_t down = (letter == letter_a) ? letter_z : letter - 1;
        rv[i] = of_code(rest | (up << shift));
        rv[i + shift_positions] = of_code(rest | (down << shift));
    }
    return rv;
}

size_t Word::hash() const {
    return boost::hash<uint64_t>()(c);
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os << x.to_string();
}

// "-" for a missing neighbour
static std::string str(const boost::optional<Word>& x) {
    return x ? x->to_string() : "-";
}

template <size_t N>
static std::ostream& print_all(std::ostream& os, const std::array<boost::optional<Word>, N>& ws) {
    for (size_t i = 0; i < N; i++) {
        if (i) os << " ";
        os << str(ws[i]);
    }
    return os;
}

static void check(const std::stringstream& output, const std::stringstream& expected, int n) {
    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Word::test() " + std::to_string(n) + " failed, got\n" + output_str + ", but expected\n" + expected_str);
    }
}

void Word::test() {
    // encoding, decoding, length
    {
        std::stringstream output;
        std::stringstream expected;
        Word a("a");
        Word ab("ab");
        Word z("z");
        Word longest("abcdefghijkl");
        output << a << " " << a.code() << " " << a.length() << std::endl;
        output << ab << " " << ab.code() << " " << ab.length() << std::endl;
        output << z << " " << z.code() << " " << z.length() << std::endl;
        output << Word("abcde") << " " << Word("abcde").length() << std::endl;
        output << Word("abcdefghi") << " " << Word("abcdefghi").length() << std::endl;
        output << longest << " " << longest.length() << std::endl;
        output << Word("zzzzzz").length() << " " << Word("aaaaaa").length() << std::endl;
        output << (Word("sick") == Word("sick")) << (Word("sick") == Word("true")) << std::endl;

        expected << "a 1 1" << std::endl;
        expected << "ab " << (1 + (2 << 5)) << " 2" << std::endl;
        expected << "z 26 1" << std::endl;
        expected << "abcde 5" << std::endl;
        expected << "abcdefghi 9" << std::endl;
        expected << "abcdefghijkl 12" << std::endl;
        expected << "6 6" << std::endl;
        expected << "10" << std::endl;
        check(output, expected, 1);
    }

    // bad input is rejected before it becomes a Word
    {
        std::stringstream output;
        std::stringstream expected;
        const char* bad[] = { "", "Sick", "si ck", "a1", "abcdefghijklm", "\xe9t\xe9" };
        for (const char* b : bad) {
            try {
                Word w(b);
                output << "accepted " << w << std::endl;
            } catch (const std::runtime_error&) {
                output << "rejected" << std::endl;
            }
        }
        try {
            Word w = Word::of_code(0);
            output << "accepted " << w << std::endl;
        } catch (const std::logic_error&) {
            output << "rejected zero" << std::endl;
        }
        for (int i = 0; i < 6; i++) expected << "rejected" << std::endl;
        expected << "rejected zero" << std::endl;
        check(output, expected, 2);
    }

    // dupl_first and pop
    {
        std::stringstream output;
        std::stringstream expected;
        output << str(Word("a").dupl_first(8)) << " " << str(Word("a").pop()) << std::endl;
        output << str(Word("ab").dupl_first(6)) << " " << str(Word("abcde").dupl_first(6)) << " " << str(Word("abcdef").dupl_first(6)) << std::endl;
        output << str(Word("abc").dupl_first(3)) << " " << str(Word("abc").dupl_first(4)) << std::endl;
        output << str(Word("abcdefghijkl").dupl_first(99)) << std::endl;
        output << str(Word("abcde").pop()) << " " << str(Word("ab").pop()) << std::endl;
        expected << "aa -" << std::endl;
        expected << "aab aabcde -" << std::endl;
        expected << "- aabc" << std::endl;
        expected << "-" << std::endl;
        expected << "bcde b" << std::endl;
        check(output, expected, 3);
    }

    // rotate
    {
        std::stringstream output;
        std::stringstream expected;
        print_all(output, Word("a").rotate()) << std::endl;
        print_all(output, Word("aa").rotate()) << std::endl;
        print_all(output, Word("ab").rotate()) << std::endl;
        print_all(output, Word("abc").rotate()) << std::endl;
        print_all(output, Word("abab").rotate()) << std::endl;
        print_all(output, Word("abcdefghijkl").rotate()) << std::endl;
        expected << "- -" << std::endl;
        expected << "aa aa" << std::endl;
        expected << "ba ba" << std::endl;
        expected << "bca cab" << std::endl;
        expected << "baba baba" << std::endl;
        expected << "bcdefghijkla labcdefghijk" << std::endl;
        check(output, expected, 4);
    }

    // shifts
    {
        std::stringstream output;
        std::stringstream expected;
        print_all(output, Word("a").shifts()) << std::endl;
        print_all(output, Word("z").shifts()) << std::endl;
        print_all(output, Word("bc").shifts()) << std::endl;
        print_all(output, Word("oooooo").shifts()) << std::endl;
        expected << "b - - - - - z - - - - -" << std::endl;
        expected << "a - - - - - y - - - - -" << std::endl;
        expected << "cc bd - - - - ac bb - - - -" << std::endl;
        expected << "pooooo opoooo oopooo ooopoo oooopo ooooop "
                 << "nooooo onoooo oonooo ooonoo oooono ooooon" << std::endl;
        check(output, expected, 5);
    }

    // algebraic properties over a handful of words
    {
        std::stringstream output;
        std::stringstream expected;
        const char* words[] = { "a", "z", "az", "za", "sick", "true", "abcdef", "zazazy", "qwerty", "bbbbbb" };
        int broken = 0;
        for (const char* s : words) {
            Word w(s);
            if (w.to_string() != s) broken++;
            if (w.length() != static_cast<int>(std::string(s).length())) broken++;

            boost::optional<Word> d = w.dupl_first(max_search_letters);
            if (w.length() < max_search_letters) {
                if (!d || d->length() != w.length() + 1 || *d->pop() != w) broken++;
            } else if (d) {
                broken++;
            }

            std::array<boost::optional<Word>, 12> sh = w.shifts();
            for (int i = 0; i < shift_positions; i++) {
                bool occupied = i < w.length();
                if (bool(sh[i]) != occupied || bool(sh[i + shift_positions]) != occupied) broken++;
                if (!occupied) continue;
                if (*sh[i] == w || *sh[i + shift_positions] == w) broken++;
                if (*sh[i]->shifts()[i + shift_positions] != w) broken++;
                if (*sh[i + shift_positions]->shifts()[i] != w) broken++;
            }

            std::array<boost::optional<Word>, 2> rot = w.rotate();
            if (w.length() == 1) {
                if (rot[0] || rot[1]) broken++;
            } else {
                if (*rot[0]->rotate()[1] != w) broken++;
                if (*rot[1]->rotate()[0] != w) broken++;
            }
        }
        output << broken << std::endl;
        expected << 0 << std::endl;
        check(output, expected, 6);
    }
}
