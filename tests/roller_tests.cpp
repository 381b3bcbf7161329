#include "test_common.hpp"
#include "test_helpers.hpp"

#include "errors.hpp"
#include "roller.hpp"

using namespace dice;

void test_basic_roll_expression() {
    ScriptedRandom random;
    Roller roller(random);
    ASSERT_EQ(roller.basic("3d4"), Number(12));
    ASSERT_EQ(roller.basic("3d4", Mode::Normal, 2), Number(14));
    ASSERT_EQ(roller.basic(""), Number(0));
    ASSERT_EQ(roller.basic(Number(5), Mode::Normal, 2), Number(7));
    ASSERT_EQ(roller.basic(Number(5), Mode::Max), Number(5));
}

void test_roll_modes() {
    ScriptedRandom random;
    Roller roller(random);
    ASSERT_EQ(roller.basic("3d4", Mode::Average), Number(7.5));
    ASSERT_EQ(roller.basic("3d6", Mode::Max), Number(18));
    ASSERT_EQ(roller.basic("3d4", Mode::Crit), Number(24));
    ASSERT_EQ(roller.basic("1d20+5", Mode::Crit), Number(13));
}

void test_compiled_tree_is_reused() {
    ScriptedRandom random({5, 9});
    Roller roller(random);
    EvalTree compiled = roller.compile("1d20");

    ASSERT_EQ(roller.basic(compiled), Number(5));
    ASSERT_EQ(roller.basic(compiled), Number(9));
    ASSERT_EQ(roller.basic(compiled, Mode::Max), Number(20));
    ASSERT(compiled.root()->value() == nullptr);
    ASSERT_EQ(compiled.root()->op()->code, "d");
}

void test_compile() {
    ScriptedRandom random;
    Roller roller(random);

    EvalTree modified = roller.compile("3d4", 2);
    ASSERT_EQ(modified.evaluate(random), Number(14));

    EvalTree number = roller.compile(Number(3), 2);
    ASSERT_EQ(number.evaluate(random), Number(5));

    // Нулевой модификатор не добавляет узел
    ASSERT(roller.compile("1d4") == EvalTree("1d4"));

    ASSERT_THROWS(roller.compile(EvalTree("1d4")), InputTypeError);
    ASSERT_THROWS(roller.compile("1d"), ParseError);
}

void test_verbose_roll() {
    ScriptedRandom random({17});
    Roller roller(random);
    ASSERT_EQ(roller.verbose("1d20", Mode::Normal, 2), "[d20: 17]+2 = 19");
    ASSERT_EQ(roller.verbose("1+2*4"), "1+2*4 = 9");
    ASSERT_EQ(roller.verbose("2d6", Mode::Max), "[d6: 6, 6] = 12");
    ASSERT_EQ(roller.verbose("1d4", Mode::Average), "[d4: 2.5] = 2.5");
    ASSERT_EQ(roller.verbose(Number(3), Mode::Normal, 1), "3+1 = 4");
}

void test_roller_tokens() {
    ScriptedRandom random;
    Roller roller(random);

    std::vector<Token> modified = roller.tokenize("1d4", 2);
    std::vector<Token> expected = {makeParenToken(true), makeNumberToken(Number(1)), makeOperatorToken("d"),
                                   makeNumberToken(Number(4)), makeParenToken(false), makeOperatorToken("+"),
                                   makeNumberToken(Number(2))};
    ASSERT_EQ(modified, expected);

    std::vector<Token> number = roller.tokenize(Number(3), 2);
    std::vector<Token> expectedNumber = {makeNumberToken(Number(3)), makeOperatorToken("+"),
                                         makeNumberToken(Number(2))};
    ASSERT_EQ(number, expectedNumber);

    ASSERT_EQ(roller.tokenize(Number(3)).size(), 1u);
    ASSERT_EQ(roller.tokenize("2d6").size(), 3u);
    ASSERT_THROWS(roller.tokenize(EvalTree("1d4")), InputTypeError);
}

void test_roll_errors() {
    ScriptedRandom random;
    Roller roller(random);
    ASSERT_THROWS(roller.basic("1d"), ParseError);
    ASSERT_THROWS(roller.basic("1d0"), EvaluationError);
    ASSERT_THROWS(roller.verbose("(1d4"), ParseError);

    // Любая ошибка библиотеки перехватывается как RollError
    ASSERT_THROWS(roller.basic("1x4"), RollError);
    ASSERT_THROWS(roller.basic("1/0"), RollError);
}

void test_mode_names() {
    ASSERT_EQ(modeFromString("average"), Mode::Average);
    ASSERT_EQ(modeFromString("AVERAGE"), Mode::Average);
    ASSERT_EQ(modeFromString("critical"), Mode::Crit);
    ASSERT_EQ(modeFromString("Maximum"), Mode::Max);
    ASSERT_EQ(modeFromString("normal"), Mode::Normal);
    ASSERT_EQ(modeFromString(""), Mode::Normal);
}

void test_default_random_source() {
    for (int i = 0; i < 100; ++i) {
        Number value = rollBasic("1d6");
        ASSERT_GE(value, Number(1));
        ASSERT_LE(value, Number(6));
    }
    ASSERT_EQ(rollBasic("3d6", Mode::Max), Number(18));
    ASSERT_EQ(rollVerbose("2+2"), "2+2 = 4");
    ASSERT_EQ(compile("1d6", 1).root()->op()->code, "+");

    MersenneRandomSource seeded(42);
    MersenneRandomSource same(42);
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(seeded.uniformInt(1, 20), same.uniformInt(1, 20));
    }
}

void roller_tests() {
    RUN_TEST(test_basic_roll_expression);
    RUN_TEST(test_roll_modes);
    RUN_TEST(test_compiled_tree_is_reused);
    RUN_TEST(test_compile);
    RUN_TEST(test_verbose_roll);
    RUN_TEST(test_roller_tokens);
    RUN_TEST(test_roll_errors);
    RUN_TEST(test_mode_names);
    RUN_TEST(test_default_random_source);
}
