//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "gtest/gtest.h"

#include <string>
#include <vector>

#include <treenorm/tree.hpp>
#include <treenorm/binarize.hpp>
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

  std::string binarize_right(const std::string& x, const Symbol& top=Symbol::TOP)
  {
    Tree binarized;
    treenorm::binarize_right(parse(x), binarized, top);
    return binarized.string();
  }

  std::string binarize_left(const std::string& x)
  {
    Tree binarized;
    treenorm::binarize_left(parse(x), binarized);
    return binarized.string();
  }

  // every internal node is binary or unary; unary only above a preterminal or at the top
  bool is_binary(const Tree& tree, const bool root)
  {
    if (tree.terminal() || tree.preterminal()) return true;

    if (tree.antecedent_.size() > 2) return false;
    if (tree.antecedent_.size() == 1 && ! root && ! tree.antecedent_.front().preterminal()) return false;

    for (Tree::const_iterator aiter = tree.begin(); aiter != tree.end(); ++ aiter)
      if (! is_binary(*aiter, false))
	return false;
    return true;
  }
};

class BinarizeTest : public testing::Test {
protected:
  std::vector<std::string> treebank_;

  virtual void SetUp() {
    treebank_.push_back("(TOP (S (VP (VB Book) (NP (DT that) (NN flight)))) (PUNC .))");
    treebank_.push_back("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks)) (PUNC .)))");
    treebank_.push_back("(TOP (A (B (C (D d) (E e)))))");
    treebank_.push_back("(TOP (A (B (C (D (E (NN word)))))))");
    treebank_.push_back("(TOP (X (A a) (B b) (C c) (D d) (E e) (F f) (G g) (H h) (I i) (J j) (K k) (L l)))");
    treebank_.push_back("(TOP (A (B (C c) (D d) (E e))) (F (G (H h) (I i) (J j) (K k))))");
    treebank_.push_back("(TOP (NN word))");
    treebank_.push_back("(TOP (SQ (VBZ Is) (NP (DT the) (NN dog) (PP (IN in) (NP (DT the) (JJ big) (NN house)))) (VP (VBG barking)) (PUNC ?)))");
  }
};

TEST_F(BinarizeTest, BinaryKeepsLabel) {
  // the 2-ary VP is left untouched, the unary S above VP is fused
  EXPECT_EQ("(TOP (S_VP (VB Book) (NP (DT that) (NN flight))) (PUNC .))",
	    binarize_right("(TOP (S (VP (VB Book) (NP (DT that) (NN flight)))) (PUNC .))"));
}

TEST_F(BinarizeTest, RightBranching) {
  EXPECT_EQ("(TOP (S (NP (DT the) (NN dog)) (S* (VP (VBZ barks)) (PUNC .))))",
	    binarize_right("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks)) (PUNC .)))"));

  // synthetic labels never accumulate '*'
  EXPECT_EQ("(TOP (X (A a) (X* (B b) (X* (C c) (D d)))))",
	    binarize_right("(TOP (X (A a) (B b) (C c) (D d)))"));
}

TEST_F(BinarizeTest, LeftBranching) {
  EXPECT_EQ("(TOP (S (S* (NP (DT the) (NN dog)) (VP (VBZ barks))) (PUNC .)))",
	    binarize_left("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks)) (PUNC .)))"));

  EXPECT_EQ("(TOP (X (X* (X* (A a) (B b)) (C c)) (D d)))",
	    binarize_left("(TOP (X (A a) (B b) (C c) (D d)))"));
}

TEST_F(BinarizeTest, Heuristic) {
  Tree binarized;

  // SQ is right-heavy, everything else left-heavy
  treenorm::binarize_heuristic(parse("(TOP (SQ (VBZ Is) (NP (DT the) (NN dog)) (VP (VBG barking)) (PUNC ?)))"), binarized);
  EXPECT_EQ("(TOP (SQ (VBZ Is) (SQ* (NP (DT the) (NN dog)) (SQ* (VP (VBG barking)) (PUNC ?)))))", binarized.string());

  treenorm::binarize_heuristic(parse("(TOP (S (NP (DT the) (NN dog)) (VP (VBZ barks)) (PUNC .)))"), binarized);
  EXPECT_EQ("(TOP (S (S* (NP (DT the) (NN dog)) (VP (VBZ barks))) (PUNC .)))", binarized.string());

  treenorm::binarize_heuristic(parse("(TOP (SQ (A a) (B b) (X (C c) (D d) (E e))))"), binarized);
  EXPECT_EQ("(TOP (SQ (A a) (SQ* (B b) (X (X* (C c) (D d)) (E e)))))", binarized.string());
}

TEST_F(BinarizeTest, HeuristicLabels) {
  std::vector<Symbol> labels;
  labels.push_back(Symbol::non_terminal("X"));

  treenorm::BinarizeHeuristic binarizer(labels.begin(), labels.end());

  EXPECT_TRUE(binarizer.right(Symbol::non_terminal("X")));
  EXPECT_FALSE(binarizer.right(Symbol::non_terminal("SQ")));

  Tree binarized;
  binarizer(parse("(TOP (SQ (A a) (B b) (X (C c) (D d) (E e))))"), binarized);
  EXPECT_EQ("(TOP (SQ (SQ* (A a) (B b)) (X (C c) (X* (D d) (E e)))))", binarized.string());

  // fusion and the reserved marker check are shared with the other binarizers
  binarizer(parse("(TOP (A (X (C c) (D d) (E e))))"), binarized);
  EXPECT_EQ("(TOP (A_X (C c) (X* (D d) (E e))))", binarized.string());

  EXPECT_THROW(binarizer(parse("(TOP (S_Q (A a) (B b) (C c)))"), binarized), treenorm::StructuralInvariantError);
}

TEST_F(BinarizeTest, UnaryChain) {
  EXPECT_EQ("(TOP (A_B_C (D d) (E e)))",
	    binarize_right("(TOP (A (B (C (D d) (E e)))))"));
}

TEST_F(BinarizeTest, UnaryChainAbovePreterminal) {
  // the preterminal is not fused into the chain
  EXPECT_EQ("(TOP (A_B (NN word)))", binarize_right("(TOP (A (B (NN word))))"));
  EXPECT_EQ("(TOP (NP (NN word)))", binarize_right("(TOP (NP (NN word)))"));
}

TEST_F(BinarizeTest, UnaryAboveBinarized) {
  EXPECT_EQ("(TOP (A_B (C c) (B* (D d) (E e))))",
	    binarize_right("(TOP (A (B (C c) (D d) (E e))))"));
}

TEST_F(BinarizeTest, TopIsExempt) {
  EXPECT_EQ("(TOP (S (NP (NN a)) (VP (VB b))))", binarize_right("(TOP (S (NP (NN a)) (VP (VB b))))"));

  // not the top label: the root is fused like any other node
  EXPECT_EQ("(S_NP (NN a))", binarize_right("(S (NP (NN a)))"));
  EXPECT_EQ("(S (NP (NN a)))", binarize_right("(S (NP (NN a)))", Symbol::non_terminal("S")));
}

TEST_F(BinarizeTest, RejectReservedMarker) {
  EXPECT_THROW(binarize_right("(TOP (A_B (NN a)))"), treenorm::StructuralInvariantError);
  EXPECT_THROW(binarize_right("(TOP (NP* (NN a) (NN b)))"), treenorm::StructuralInvariantError);
  EXPECT_THROW(binarize_right("(TOP (N_N a))"), treenorm::StructuralInvariantError);
  EXPECT_THROW(binarize_left("(TOP (S (A a) (B b) (C* c)))"), treenorm::StructuralInvariantError);
}

TEST_F(BinarizeTest, Empty) {
  EXPECT_EQ("", binarize_right(""));
}

TEST_F(BinarizeTest, InPlace) {
  Tree tree = parse("(TOP (X (A a) (B b) (C c)))");
  const Tree source = tree;

  treenorm::binarize_right(tree);
  EXPECT_EQ("(TOP (X (A a) (X* (B b) (C c))))", tree.string());

  // the source tree is not touched by the copying form
  Tree binarized;
  treenorm::binarize_left(source, binarized);
  EXPECT_EQ("(TOP (X (A a) (B b) (C c)))", source.string());
}

TEST_F(BinarizeTest, Arity) {
  for (size_t i = 0; i != treebank_.size(); ++ i) {
    const Tree tree = parse(treebank_[i]);

    Tree right;
    Tree left;
    Tree heuristic;
    treenorm::binarize_right(tree, right);
    treenorm::binarize_left(tree, left);
    treenorm::binarize_heuristic(tree, heuristic);

    EXPECT_TRUE(is_binary(right, true)) << right;
    EXPECT_TRUE(is_binary(left, true)) << left;
    EXPECT_TRUE(is_binary(heuristic, true)) << heuristic;

    EXPECT_EQ(tree.size(), right.size());
    EXPECT_EQ(tree.size(), left.size());
    EXPECT_EQ(tree.size(), heuristic.size());
  }
}
