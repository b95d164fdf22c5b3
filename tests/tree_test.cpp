//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "gtest/gtest.h"

#include <sstream>
#include <vector>
#include <iterator>

#include <treenorm/tree.hpp>
#include <treenorm/error.hpp>

using treenorm::Symbol;
using treenorm::Tree;

namespace
{
  Tree parse(const std::string& x)
  {
    Tree tree;
    tree.assign(x);
    return tree;
  }
};

// Tests that a tree string is read into terminal/preterminal/internal nodes.
TEST(TreeTest, ReadGenericTree) {
  //            TOP
  //           /   \
  //          S     PUNC
  //          |      |
  //          VP     .
  //        /    \
  //      VB      NP
  //      |      /  \
  //     Book   DT   NN
  //            |    |
  //          that  flight
  const Tree tree = parse("(TOP (S (VP (VB Book) (NP (DT that) (NN flight)))) (PUNC .))");

  EXPECT_EQ(Symbol("[TOP]"), tree.label_);
  ASSERT_EQ(2u, tree.antecedent_.size());
  EXPECT_TRUE(tree.internal());

  const Tree& s = tree.antecedent_[0];
  EXPECT_EQ(Symbol("[S]"), s.label_);
  EXPECT_EQ(1u, s.antecedent_.size());
  EXPECT_TRUE(s.internal());
  EXPECT_FALSE(s.preterminal());

  const Tree& punc = tree.antecedent_[1];
  EXPECT_TRUE(punc.preterminal());
  EXPECT_EQ(Symbol("[PUNC]"), punc.label_);
  EXPECT_TRUE(punc.antecedent_.front().terminal());
  EXPECT_EQ(Symbol("."), punc.antecedent_.front().label_);

  EXPECT_EQ(4u, tree.size());

  std::vector<Symbol> leaves;
  tree.leaves(std::back_inserter(leaves));
  ASSERT_EQ(4u, leaves.size());
  EXPECT_EQ(Symbol("Book"), leaves[0]);
  EXPECT_EQ(Symbol("that"), leaves[1]);
  EXPECT_EQ(Symbol("flight"), leaves[2]);
  EXPECT_EQ(Symbol("."), leaves[3]);
}

TEST(TreeTest, WriteExactInverse) {
  const std::string text = "(TOP (S (VP (VB Book) (NP (DT that) (NN flight)))) (PUNC .))";

  EXPECT_EQ(text, parse(text).string());

  std::ostringstream os;
  os << parse(text);
  EXPECT_EQ(text, os.str());
}

TEST(TreeTest, IncidentalWhitespace) {
  const Tree tree = parse("  (TOP(S (NP  (DT the)\t(NN dog))(VP (VBZ barks))))  ");

  EXPECT_EQ("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks))))", tree.string());
  EXPECT_EQ(tree, parse("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks))))"));
}

TEST(TreeTest, TerminalsKeepMarkers) {
  // '*' and '_' are reserved for labels only
  const Tree tree = parse("(TOP (NP (NN *-1) (NN a_b)))");

  EXPECT_EQ("(TOP (NP (NN *-1) (NN a_b)))", tree.string());
  EXPECT_FALSE(tree.antecedent_[0].antecedent_[0].antecedent_[0].label_.binarized());
}

TEST(TreeTest, Empty) {
  Tree tree = parse("");
  EXPECT_TRUE(tree.empty());
  EXPECT_EQ("", tree.string());
  EXPECT_EQ(0u, tree.size());

  tree = parse("   \t");
  EXPECT_TRUE(tree.empty());
}

TEST(TreeTest, RejectUnbalanced) {
  EXPECT_THROW(parse("(A (B b)))"), treenorm::SyntaxError);
  EXPECT_THROW(parse("(A (B b)"), treenorm::SyntaxError);
  EXPECT_THROW(parse(")"), treenorm::SyntaxError);
}

TEST(TreeTest, RejectMissingChildren) {
  EXPECT_THROW(parse("(A)"), treenorm::SyntaxError);
  EXPECT_THROW(parse("()"), treenorm::SyntaxError);
  EXPECT_THROW(parse("(TOP (NP (NN) (NN dog)))"), treenorm::SyntaxError);
}

TEST(TreeTest, RejectEmptyLabel) {
  EXPECT_THROW(parse("( (S (NN a)))"), treenorm::SyntaxError);
}

TEST(TreeTest, RejectBareWord) {
  EXPECT_THROW(parse("dog"), treenorm::SyntaxError);
}

TEST(TreeTest, RejectMultipleTerminals) {
  EXPECT_THROW(parse("(A B C)"), treenorm::SyntaxError);
  EXPECT_THROW(parse("(TOP (NP the (NN dog)))"), treenorm::SyntaxError);
}

TEST(TreeTest, ReadStream) {
  std::istringstream is("(TOP (NN a))\n(TOP (NN b))\n");

  Tree tree;

  ASSERT_TRUE(static_cast<bool>(is >> tree));
  EXPECT_EQ("(TOP (NN a))", tree.string());
  ASSERT_TRUE(static_cast<bool>(is >> tree));
  EXPECT_EQ("(TOP (NN b))", tree.string());
  EXPECT_FALSE(static_cast<bool>(is >> tree));
  EXPECT_TRUE(tree.empty());
}

TEST(TreeTest, Comparison) {
  const Tree tree1 = parse("(TOP (A (B b) (C (D d) (E e) (F f))))");
  const Tree tree2 = parse("(TOP(A(B b)(C(D d)(E e)(F f))))");
  const Tree tree3 = parse("(TOP (A (B b) (C (D d) (E z) (F f))))");
  const Tree tree4 = parse("(TOP (A (Q b) (C (D d) (E e) (F f))))");
  const Tree tree5 = parse("(TOP (A (B b) (C (D d) (E e) (F f) (G g))))");

  EXPECT_EQ(tree1, tree2);
  EXPECT_NE(tree1, tree3);
  EXPECT_NE(tree1, tree4);
  EXPECT_NE(tree1, tree5);
  EXPECT_EQ(hash_value(tree1), hash_value(tree2));
}
