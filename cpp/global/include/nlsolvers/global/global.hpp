//--------------------------------------------------------------------------
#ifndef NLSOLVERS_GLOBAL_GLOBAL_H
#define NLSOLVERS_GLOBAL_GLOBAL_H
//--------------------------------------------------------------------------

#include <vector>
#include <string>
#include <iostream>
#include <iomanip>

namespace nlsolvers {

template <typename T>
void print(std::string text, T var, int precision=15) {
    std::cout << text << ": " << std::setprecision(precision) << var << std::endl;
    return;
}

template <typename T>
void print(std::string text, const std::initializer_list<T>& list, int precision=15)
{
    std::cout << text << ": " << std::setprecision(precision);
    for( T elem : list )
    {
        std::cout << elem << " ";
    }
    std::cout << "\n";
    return;
}

template <typename T>
void print(std::string text, const std::vector<T>& vec, int n_rows=1, int precision=15) {
    std::cout << text << ": " << std::setprecision(precision);
    int n_cols = static_cast<int>(vec.size()) / n_rows;
    for (int i = 0; i < n_rows; i++)
    {
        for (int j = 0; j < n_cols; j++)
        {
            std::cout << vec[i*n_cols + j] << " ";
        }
        std::cout << "\n";
    }
    return;
}

} // namespace nlsolvers

//--------------------------------------------------------------------------
#endif // NLSOLVERS_GLOBAL_GLOBAL_H
//--------------------------------------------------------------------------
