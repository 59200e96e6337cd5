#include "brayton/thermophysics/air_reference_table.hpp"

namespace brayton::thermophysics {

auto reference_air_table() -> const PropertyTable& {
  static const PropertyTable table{
      .temperature = {200.0,  250.0,  300.0,  350.0,  400.0,  450.0,  500.0,  550.0,  600.0,  650.0,  700.0,
                      750.0,  800.0,  860.0,  900.0,  960.0,  1000.0, 1060.0, 1100.0, 1160.0, 1200.0, 1260.0,
                      1300.0, 1360.0, 1400.0, 1460.0, 1500.0, 1600.0, 1700.0, 1800.0, 1900.0, 2000.0},
      .enthalpy = {199.97,  250.05,  300.19,  350.49,  400.98,  451.80,  503.02,  554.74,  607.02,  659.84,  713.27,
                   767.29,  821.95,  888.27,  932.93,  1000.55, 1046.04, 1114.86, 1161.07, 1230.92, 1277.79, 1348.55,
                   1395.97, 1467.49, 1515.42, 1587.63, 1635.97, 1757.57, 1880.1,  2003.3,  2127.4,  2252.1},
      .entropy = {1.29559, 1.51917, 1.70203, 1.85708, 1.99194, 2.11161, 2.21952, 2.31809, 2.40902, 2.49364, 2.57277,
                  2.64737, 2.71787, 2.79783, 2.84856, 2.92128, 2.96770, 3.03449, 3.07732, 3.13916, 3.17888, 3.23638,
                  3.27345, 3.32724, 3.36200, 3.41247, 3.44516, 3.52364, 3.5979,  3.6684,  3.7354,  3.7994}};
  return table;
}

} // namespace brayton::thermophysics
