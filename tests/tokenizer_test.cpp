#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "errors.hpp"
#include "tokenizer.hpp"

using namespace veq;

class TokenizerTest : public ::testing::Test {
protected:
    static std::vector<Token> lex(const std::string& text) {
        Tokenizer tokenizer(text);
        return tokenizer.tokenize();
    }

    static std::vector<std::string> texts(const std::vector<Token>& tokens) {
        std::vector<std::string> result;
        for (const auto& token : tokens) {
            if (token.type != TokenType::End) {
                result.push_back(token.text);
            }
        }
        return result;
    }
};

// =============================================================================
// Basic tokens
// =============================================================================

TEST_F(TokenizerTest, EmptyInput_ProducesOnlyEnd)
{
    auto tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::End);
    EXPECT_EQ(tokens[0].position, 0u);
}

TEST_F(TokenizerTest, WhitespaceOnly_ProducesOnlyEnd)
{
    auto tokens = lex("  \t \n ");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::End);
    EXPECT_EQ(tokens[0].position, 6u);
}

TEST_F(TokenizerTest, Operators_AreSingleCharacterTokens)
{
    auto tokens = lex("+ - * / ^ %");
    ASSERT_EQ(tokens.size(), 7u);
    for (std::size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(tokens[i].type, TokenType::Operator);
        EXPECT_EQ(tokens[i].position, i * 2);
    }
    EXPECT_EQ(texts(tokens), (std::vector<std::string>{"+", "-", "*", "/", "^", "%"}));
}

TEST_F(TokenizerTest, Parentheses_AreRecognized)
{
    auto tokens = lex("()");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::LParen);
    EXPECT_EQ(tokens[1].type, TokenType::RParen);
    EXPECT_EQ(tokens[2].position, 2u);
}

// =============================================================================
// Numbers
// =============================================================================

TEST_F(TokenizerTest, Numbers_IntegerAndDecimal)
{
    auto tokens = lex("42 3.25 .5 7.");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_DOUBLE_EQ(tokens[0].numericValue, 42.0);
    EXPECT_DOUBLE_EQ(tokens[1].numericValue, 3.25);
    EXPECT_DOUBLE_EQ(tokens[2].numericValue, 0.5);
    EXPECT_DOUBLE_EQ(tokens[3].numericValue, 7.0);
    EXPECT_EQ(tokens[2].position, 8u);
}

TEST_F(TokenizerTest, SecondDot_StartsNewNumber)
{
    auto tokens = lex("1.2.3");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].text, "1.2");
    EXPECT_EQ(tokens[1].text, ".3");
    EXPECT_EQ(tokens[1].position, 3u);
}

TEST_F(TokenizerTest, LoneDot_IsLexError)
{
    try {
        lex("1 + .");
        FAIL() << "expected LexError";
    }
    catch (const LexError& error) {
        EXPECT_EQ(error.position(), 4u);
        EXPECT_EQ(error.character(), '.');
    }
}

TEST_F(TokenizerTest, HugeLiteral_BecomesInfinity)
{
    auto tokens = lex(std::string(400, '9'));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(std::isinf(tokens[0].numericValue));
}

// =============================================================================
// Identifiers
// =============================================================================

TEST_F(TokenizerTest, Keywords_AreSplitByLongestMatch)
{
    EXPECT_EQ(texts(lex("sinh(x)")), (std::vector<std::string>{"sinh", "(", "x", ")"}));
    EXPECT_EQ(texts(lex("asinh(t)")), (std::vector<std::string>{"asinh", "(", "t", ")"}));
    EXPECT_EQ(texts(lex("pix")), (std::vector<std::string>{"pi", "x"}));
}

TEST_F(TokenizerTest, JoinedKeywords_AreSplitCompletely)
{
    EXPECT_EQ(texts(lex("sinx")), (std::vector<std::string>{"sin", "x"}));
    EXPECT_EQ(texts(lex("xt")), (std::vector<std::string>{"x", "t"}));

    auto tokens = lex("2pix");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].text, "x");
    EXPECT_EQ(tokens[2].position, 3u);
}

TEST_F(TokenizerTest, WordWithKeywordPrefix_IsNotSplit)
{
    EXPECT_EQ(texts(lex("exp(x)")), (std::vector<std::string>{"exp", "(", "x", ")"}));
    EXPECT_EQ(texts(lex("tau")), (std::vector<std::string>{"tau"}));
    EXPECT_EQ(texts(lex("theta + x")), (std::vector<std::string>{"theta", "+", "x"}));
    EXPECT_EQ(texts(lex("sinq")), (std::vector<std::string>{"sinq"}));
}

TEST_F(TokenizerTest, Identifiers_AreLowerCased)
{
    auto tokens = lex("SIN(X)");
    EXPECT_EQ(tokens[0].text, "sin");
    EXPECT_EQ(tokens[2].text, "x");
}

TEST_F(TokenizerTest, UnknownWord_IsSingleIdentifier)
{
    auto tokens = lex("q + foo");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, TokenType::Identifier);
    EXPECT_EQ(tokens[0].text, "q");
    EXPECT_EQ(tokens[2].text, "foo");
    EXPECT_EQ(tokens[2].position, 4u);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(TokenizerTest, UnknownCharacter_ReportsPosition)
{
    try {
        lex("x + 2 $ 3");
        FAIL() << "expected LexError";
    }
    catch (const LexError& error) {
        EXPECT_EQ(error.position(), 6u);
        EXPECT_EQ(error.character(), '$');
        EXPECT_STREQ(error.what(), "unexpected character '$'");
    }
}

TEST_F(TokenizerTest, LexError_IsSyntaxError)
{
    EXPECT_THROW(lex("x,t"), SyntaxError);
}
