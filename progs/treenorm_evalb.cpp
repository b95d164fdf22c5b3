//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// labeled bracket scoring of test trees against gold trees, micro-averaged over the corpus

#include <cstdlib>
#include <stdexcept>
#include <iostream>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/treebank.hpp>
#include <treenorm/evalb.hpp>

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

typedef treenorm::Symbol symbol_type;

path_type gold_file;
path_type test_file;

std::string top_label = "TOP";

bool sentence_mode = false;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (gold_file.empty() || test_file.empty())
      throw std::runtime_error("both --gold and --test are required");

    utils::compress_istream ig(gold_file);
    utils::compress_istream it(test_file);

    treenorm::Treebank treebank_gold(ig);
    treenorm::Treebank treebank_test(it);

    treenorm::Tree gold;
    treenorm::Tree test;

    treenorm::Evalb       evalb;
    treenorm::EvalbScorer scorer(symbol_type::non_terminal(top_label));

    size_t sentences = 0;
    size_t errors = 0;

    for (;;) {
      const bool has_gold = treebank_gold.read(gold);
      const bool has_test = treebank_test.read(test);

      if (! has_gold || ! has_test) {
	if (has_gold || has_test)
	  throw std::runtime_error("# of trees does not match");
	break;
      }

      ++ sentences;

      if (treebank_gold.failed() || gold.empty()) {
	++ errors;

	std::cerr << "sentence: " << sentences << " error: no gold tree" << std::endl;
	if (treebank_gold.failed())
	  std::cerr << "gold " << treebank_gold.error() << std::endl;
	continue;
      }

      if (treebank_test.failed())
	std::cerr << "test " << treebank_test.error() << std::endl;

      try {
	scorer.assign(gold);

	const treenorm::Evalb score = scorer(test);

	evalb += score;

	if (sentence_mode)
	  std::cout << "sentence: " << sentences << ' ' << score << std::endl;

	if (debug >= 2) {
	  const treenorm::EvalbScorer::stat_set_type& stats = scorer.gold();

	  treenorm::EvalbScorer::stat_set_type::const_iterator siter_end = stats.end();
	  for (treenorm::EvalbScorer::stat_set_type::const_iterator siter = stats.begin(); siter != siter_end; ++ siter)
	    std::cerr << "gold: " << siter->second.strip() << ' ' << siter->first << std::endl;
	}
      }
      catch (const treenorm::ScoringAlignmentError& err) {
	++ errors;

	std::cerr << "sentence: " << sentences << " error: " << err.what() << std::endl;

	if (sentence_mode)
	  std::cout << "sentence: " << sentences << " error: " << err.what() << std::endl;
      }
    }

    std::cout << evalb << " sentences: " << sentences << " errors: " << errors << std::endl;
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description desc("options");
  desc.add_options()
    ("gold",      po::value<path_type>(&gold_file), "gold trees")
    ("test",      po::value<path_type>(&test_file), "test trees (debinarized parser output)")

    ("top",       po::value<std::string>(&top_label)->default_value(top_label), "top label, not counted as a constituent")

    ("sentence",  po::bool_switch(&sentence_mode), "print sentence-level scores")

    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")

    ("help", "help message");

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc << '\n';
    exit(0);
  }
}
