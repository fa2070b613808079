// Evaluation of Zernike polynomials in Noll's ordering.
// Author: Philip Salvaggio

#include "zernike_aberrations.h"

#include <cmath>
#include <cstdlib>

namespace {

double Factorial(int n) {
  double result = 1;
  for (int i = 2; i <= n; i++) result *= i;
  return result;
}

}

namespace zab {

void NollToZernikeIndices(int j, int* n, int* m) {
  if (!n || !m || j < 1) return;

  // Row n of the pyramid holds the indices (n(n+1)/2, (n+1)(n+2)/2].
  int order = 0;
  while (j > (order + 1) * (order + 2) / 2) order++;

  // Position within the row, which has order + 1 entries.
  int k = j - order * (order + 1) / 2 - 1;

  int abs_m;
  if (order % 2 == 0) {
    abs_m = 2 * ((k + 1) / 2);  // 0, 2, 2, 4, 4, ...
  } else {
    abs_m = 2 * (k / 2) + 1;  // 1, 1, 3, 3, ...
  }

  *n = order;
  if (abs_m == 0) {
    *m = 0;
  } else {
    *m = (j % 2 == 0) ? abs_m : -abs_m;
  }
}

double ZernikeRadial(int n, int m, double rho) {
  m = std::abs(m);
  if (m > n || (n - m) % 2 != 0) return 0;

  double value = 0;
  for (int s = 0; s <= (n - m) / 2; s++) {
    double coeff = Factorial(n - s) /
                   (Factorial(s) * Factorial((n + m) / 2 - s) *
                    Factorial((n - m) / 2 - s));
    if (s % 2 == 1) coeff = -coeff;
    value += coeff * pow(rho, n - 2 * s);
  }
  return value;
}

double ZernikePolynomial(int n, int m, double rho, double theta) {
  double radial = ZernikeRadial(n, m, rho);
  if (m == 0) {
    return sqrt(n + 1.0) * radial;
  }

  double norm = sqrt(2.0 * (n + 1));
  if (m > 0) {
    return norm * radial * cos(m * theta);
  }
  return norm * radial * sin(-m * theta);
}

}
