//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// binarize a treebank for training, optionally masking rare words by <unk>

#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <vector>
#include <string>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/treebank.hpp>
#include <treenorm/binarize.hpp>
#include <treenorm/unknown.hpp>

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

typedef treenorm::Symbol    symbol_type;
typedef treenorm::Tree      tree_type;
typedef treenorm::Frequency frequency_type;

typedef std::vector<tree_type, std::allocator<tree_type> > tree_set_type;

path_type input_file = "-";
path_type output_file = "-";

std::string top_label = "TOP";

bool binarize_left = false;
bool binarize_right = false;
bool binarize_heuristic = false;

std::vector<std::string> right_labels;

bool unknown = false;
int cutoff = 2;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (int(binarize_left) + binarize_right + binarize_heuristic > 1)
      throw std::runtime_error("either one of --binarize-{left,right,heuristic}");

    if (int(binarize_left) + binarize_right + binarize_heuristic == 0)
      binarize_right = true;

    if (! right_labels.empty() && ! binarize_heuristic)
      throw std::runtime_error("--right-labels is used only by --binarize-heuristic");

    if (cutoff <= 0)
      throw std::runtime_error("cutoff must be positive");

    const symbol_type top = symbol_type::non_terminal(top_label);

    const bool flush_output = (output_file == "-"
			       || (boost::filesystem::exists(output_file)
				   && ! boost::filesystem::is_regular_file(output_file)));

    utils::compress_istream is(input_file, 1024 * 1024);
    utils::compress_ostream os(output_file, 1024 * 1024);

    treenorm::Treebank treebank(is);
    treenorm::BinarizeLeft  binarizer_left(top);
    treenorm::BinarizeRight binarizer_right(top);
    treenorm::BinarizeHeuristic binarizer_heuristic(top);

    if (! right_labels.empty()) {
      binarizer_heuristic.right_.clear();

      std::vector<std::string>::const_iterator liter_end = right_labels.end();
      for (std::vector<std::string>::const_iterator liter = right_labels.begin(); liter != liter_end; ++ liter)
	binarizer_heuristic.right_.insert(symbol_type::non_terminal(*liter));
    }

    tree_type tree;
    tree_type binarized;

    tree_set_type  trees;
    frequency_type frequency;
    size_t failed = 0;

    while (treebank.read(tree)) {
      binarized.clear();

      if (treebank.failed()) {
	std::cerr << treebank.error() << std::endl;
	++ failed;
      } else {
	try {
	  treenorm::validate(tree, top);

	  if (binarize_left)
	    binarizer_left(tree, binarized);
	  else if (binarize_heuristic)
	    binarizer_heuristic(tree, binarized);
	  else
	    binarizer_right(tree, binarized);
	}
	catch (const treenorm::StructuralInvariantError& err) {
	  std::cerr << "line " << treebank.line() << ": " << err.what() << std::endl;
	  binarized.clear();
	  ++ failed;
	}
      }

      if (unknown) {
	frequency.collect(binarized);

	trees.push_back(tree_type());
	trees.back().swap(binarized);
      } else {
	os << binarized;

	if (flush_output)
	  os << std::endl;
	else
	  os << '\n';
      }
    }

    if (unknown) {
      if (debug)
	std::cerr << "trees: " << trees.size() << " vocabulary: " << frequency.size() << std::endl;

      const treenorm::MaskUnknown mask(frequency, cutoff);

      tree_type masked;

      tree_set_type::const_iterator titer_end = trees.end();
      for (tree_set_type::const_iterator titer = trees.begin(); titer != titer_end; ++ titer) {
	mask(*titer, masked);

	os << masked;

	if (flush_output)
	  os << std::endl;
	else
	  os << '\n';
      }
    }

    if (debug)
      std::cerr << "lines: " << treebank.line() << " failed: " << failed << std::endl;
  } catch (const std::exception& err) {
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
    ("input",     po::value<path_type>(&input_file)->default_value(input_file),   "input file")
    ("output",    po::value<path_type>(&output_file)->default_value(output_file), "output")

    ("top",       po::value<std::string>(&top_label)->default_value(top_label), "top label of each tree")

    ("binarize-left",  po::bool_switch(&binarize_left),  "left recursive (or left heavy) binarization")
    ("binarize-right", po::bool_switch(&binarize_right), "right recursive (or right heavy) binarization (default)")
    ("binarize-heuristic", po::bool_switch(&binarize_heuristic), "right heavy for --right-labels, left heavy otherwise")
    ("right-labels",   po::value<std::vector<std::string> >(&right_labels)->multitoken(), "right heavy labels for --binarize-heuristic (default: SQ)")

    ("unknown",   po::bool_switch(&unknown),                                "replace rare words by <unk>")
    ("cutoff",    po::value<int>(&cutoff)->default_value(cutoff),           "words observed less than cutoff are rare")

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
