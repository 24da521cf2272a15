// examples/train_tanh_mlp.cpp: fit a 3-4-4-1 tanh MLP to four points
// - Plain gradient descent written against the public API
// - Prints loss every few steps and the final predictions
// - Usage: train_tanh_mlp [steps=100] [lr=0.05]   (SG_SEED=<n> picks the init)

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sg/all.hpp"

using sg::Value;

int main(int argc, char** argv) {
  int steps = 100;
  double lr = 0.05;
  try {
    if (argc > 1) steps = std::stoi(argv[1]);
    if (argc > 2) lr = std::stod(argv[2]);
  } catch (const std::exception& e) {
    std::cerr << "bad argument: " << e.what() << "\nusage: " << argv[0] << " [steps] [lr]\n";
    return 2;
  }

  const std::vector<std::vector<double>> xs = {
    {2.0, 3.0, -1.0},
    {3.0, -1.0, 0.5},
    {0.5, 1.0, 1.0},
    {1.0, 1.0, -1.0},
  };
  const std::vector<double> ys = {1.0, -1.0, -1.0, 1.0};

  sg::nn::MLP net(3, {4, 4, 1});
  std::cout << net << "\n";
  std::cout << "parameters: " << net.parameters().size()
            << "  seed: " << sg::config::default_seed() << "\n";

  std::cout << std::fixed << std::setprecision(6);
  for (int k = 0; k < steps; ++k) {
    // forward
    Value loss(0.0, "loss");
    for (std::size_t i = 0; i < xs.size(); ++i) {
      loss = loss + sg::pow(net.output(xs[i]) - ys[i], 2);
    }

    // backward
    net.zero_grad();
    loss.backward();

    // update
    for (auto& p : net.parameters()) p.set_value(p.value() - lr * p.grad());

    if (k % 10 == 0 || k + 1 == steps) std::cout << "step " << k << "  loss " << loss.value() << "\n";
  }

  for (std::size_t i = 0; i < xs.size(); ++i) {
    std::cout << "target " << std::setw(10) << ys[i]
              << "  pred " << std::setw(10) << net.output(xs[i]).value() << "\n";
  }
  return 0;
}
