#ifndef __DATAGEN_C_API_HPP___
#define __DATAGEN_C_API_HPP___

extern "C" {
    int datagen_mn_to_file(
        int rows,
        int cols,
        int empty_cells,
        int depth,
        unsigned int seed,
        const char* method,
        const char* out_dir,
        char* out_path_buf,
        int out_path_buf_len
    );
}

#endif // __DATAGEN_C_API_HPP___
