/* Represents a short lowercase word packed into a single 64-bit integer.

   Each letter takes 5 bits ('a' = 1 ... 'z' = 26, 0 = no letter). The first letter lives in
   the least significant field, so letters are always packed from field 0 with no gaps and
   the packed value of a valid Word is never zero. 12 letters fit into 64 bits.

   The four ladder operators (dupl_first, pop, rotate, shifts) work directly on the packed
   value and return new Words. A missing neighbour (eg. pop of a one letter word) is an empty
   boost::optional, never a zero Word.

   The search only ever holds words of at most max_search_letters letters, which is what
   shifts() covers (2 neighbours per position, 12 slots).
*/

#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <iostream>
#include <boost/optional.hpp>

class Word {
public:
    // throws std::runtime_error unless r is 1..max_letters letters in 'a'..'z'
    Word(const std::string& r);

    // throws std::logic_error on 0, which no operator may ever produce
    static Word of_code(uint64_t code);

    uint64_t code() const { return c; }
    std::string to_string() const;

    // number of occupied fields, from the leading zero count
    int length() const;

    // [a, a, rest...], or none if the word already has max_length letters
    boost::optional<Word> dupl_first(int max_length) const;
    // drops the first letter, none for a one letter word
    boost::optional<Word> pop() const;
    // [0] moves the first letter to the end, [1] moves the last letter to the front.
    // Both none for a one letter word. Periodic words get the same Word twice.
    std::array<boost::optional<Word>, 2> rotate() const;
    // [i] = letter i plus one, [i + shift_positions] = letter i minus one, wrapping a <-> z.
    // Positions past the end of the word are none.
    std::array<boost::optional<Word>, 12> shifts() const;

    bool operator==(const Word& r) const { return c == r.c; }
    bool operator!=(const Word& r) const { return c != r.c; }
    bool operator<(const Word& r) const { return c < r.c; }
    size_t hash() const;

    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    static const int bits_per_letter = 5;
    static const int max_letters = 12;
    static const int shift_positions = 6;
    static const int max_search_letters = 6;

    static void test();
private:
    explicit Word(uint64_t c_) : c(c_) {}
    uint64_t c;
};

struct WordHash {
    size_t operator()(const Word& w) const { return w.hash(); }
};

std::ostream& operator<<(std::ostream& os, const Word& x);
